// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "components/http/http_client.h"

#include <memory>
#include <string>

#include "absl/base/call_once.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"
#include "curl/curl.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kHandleInit = 1,
  kTimeout = 2,
  kTransport = 3,
};

absl::once_flag curl_init_once;

// https://curl.se/libcurl/c/CURLOPT_WRITEFUNCTION.html
size_t WriteCallback(void* data, size_t size, size_t number_of_elements,
                     void* output) {
  reinterpret_cast<std::string*>(output)->append(reinterpret_cast<char*>(data),
                                                 size * number_of_elements);
  return size * number_of_elements;
}

struct EasyHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

class CurlHttpClient : public HttpClient {
 public:
  CurlHttpClient() {
    absl::call_once(curl_init_once,
                    [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  absl::StatusOr<HttpResponse> Post(const std::string& url,
                                    absl::string_view content_type,
                                    const std::string& body,
                                    absl::Duration timeout) override {
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(curl_slist_append(
        nullptr, absl::StrCat("Content-Type: ", content_type).c_str()));
    return Perform(url, timeout, [&](CURL* handle) {
      curl_easy_setopt(handle, CURLOPT_POST, 1L);
      curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.data());
      curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                       static_cast<curl_off_t>(body.size()));
      curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    });
  }

  absl::StatusOr<HttpResponse> Get(const std::string& url,
                                   absl::Duration timeout) override {
    return Perform(url, timeout, [](CURL* handle) {
      curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    });
  }

 private:
  template <typename Configure>
  absl::StatusOr<HttpResponse> Perform(const std::string& url,
                                       absl::Duration timeout,
                                       Configure configure) {
    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (handle == nullptr) {
      return StatusWithErrorTag(
          absl::InternalError("cannot create a curl handle"), __FILE__,
          ErrorTag::kHandleInit);
    }
    HttpResponse response;
    VLOG(5) << "Request url: " << url;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(absl::ToInt64Milliseconds(timeout)));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    configure(handle.get());
    const CURLcode result = curl_easy_perform(handle.get());
    if (result == CURLE_OPERATION_TIMEDOUT) {
      return StatusWithErrorTag(
          absl::DeadlineExceededError(
              absl::StrCat(url, ": ", curl_easy_strerror(result))),
          __FILE__, ErrorTag::kTimeout);
    }
    if (result != CURLE_OK) {
      return StatusWithErrorTag(
          absl::UnavailableError(
              absl::StrCat(url, ": ", curl_easy_strerror(result))),
          __FILE__, ErrorTag::kTransport);
    }
    long status_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = static_cast<int>(status_code);
    char* content_type = nullptr;
    curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type != nullptr) {
      response.content_type = content_type;
    }
    return response;
  }
};

}  // namespace

std::unique_ptr<HttpClient> HttpClient::Create() {
  return std::make_unique<CurlHttpClient>();
}

}  // namespace telemetry_relay
