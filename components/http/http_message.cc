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

#include "components/http/http_message.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace telemetry_relay {
namespace {

// Keeps error bodies of remote endpoints out of oversized log lines.
constexpr size_t kMaxBodyInStatus = 256;

}  // namespace

absl::string_view HttpRequest::Header(absl::string_view name) const {
  auto it = headers.find(absl::AsciiStrToLower(name));
  return it == headers.end() ? absl::string_view() : it->second;
}

HttpResponse TextResponse(int status_code, std::string body) {
  HttpResponse response;
  response.status_code = status_code;
  response.content_type = "text/plain; charset=utf-8";
  response.body = std::move(body);
  return response;
}

HttpResponse JsonResponse(int status_code, std::string body) {
  HttpResponse response;
  response.status_code = status_code;
  response.content_type = "application/json";
  response.body = std::move(body);
  return response;
}

absl::string_view ReasonPhrase(int status_code) {
  switch (status_code) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 408:
      return "Request Timeout";
    case 411:
      return "Length Required";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

std::string SerializeResponse(const HttpResponse& response) {
  std::string out = absl::StrCat("HTTP/1.1 ", response.status_code, " ",
                                 ReasonPhrase(response.status_code), "\r\n");
  if (!response.content_type.empty()) {
    absl::StrAppend(&out, "Content-Type: ", response.content_type, "\r\n");
  }
  for (const auto& [name, value] : response.headers) {
    absl::StrAppend(&out, name, ": ", value, "\r\n");
  }
  absl::StrAppend(&out, "Content-Length: ", response.body.size(),
                  "\r\nConnection: close\r\n\r\n", response.body);
  return out;
}

absl::StatusOr<HttpRequest> ParseRequestHead(absl::string_view head) {
  std::vector<absl::string_view> lines =
      absl::StrSplit(head, absl::ByString("\r\n"));
  if (lines.empty() || lines[0].empty()) {
    return absl::InvalidArgumentError("empty request line");
  }
  std::vector<absl::string_view> parts =
      absl::StrSplit(lines[0], ' ', absl::SkipEmpty());
  if (parts.size() != 3 || !absl::StartsWith(parts[2], "HTTP/1.")) {
    return absl::InvalidArgumentError(
        absl::StrCat("malformed request line '", lines[0], "'"));
  }
  HttpRequest request;
  request.method = std::string(parts[0]);
  absl::string_view target = parts[1];
  if (const size_t question = target.find('?');
      question != absl::string_view::npos) {
    request.query = std::string(target.substr(question + 1));
    target = target.substr(0, question);
  }
  if (!absl::StartsWith(target, "/")) {
    return absl::InvalidArgumentError(
        absl::StrCat("unsupported request target '", parts[1], "'"));
  }
  request.path = std::string(target);
  for (size_t i = 1; i < lines.size(); ++i) {
    if (lines[i].empty()) {
      continue;
    }
    const size_t colon = lines[i].find(':');
    if (colon == absl::string_view::npos || colon == 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("malformed header '", lines[i], "'"));
    }
    std::string name = absl::AsciiStrToLower(lines[i].substr(0, colon));
    absl::string_view value =
        absl::StripAsciiWhitespace(lines[i].substr(colon + 1));
    request.headers[name] = std::string(value);
  }
  return request;
}

absl::Status StatusFromHttpCode(int status_code, absl::string_view body) {
  if (status_code >= 200 && status_code < 300) {
    return absl::OkStatus();
  }
  const std::string message = absl::StrCat(
      "HTTP ", status_code, ": ", body.substr(0, kMaxBodyInStatus));
  if (status_code == 408) {
    return absl::DeadlineExceededError(message);
  }
  if (status_code == 429) {
    return absl::ResourceExhaustedError(message);
  }
  if (status_code >= 500) {
    return absl::UnavailableError(message);
  }
  if (status_code == 404) {
    return absl::NotFoundError(message);
  }
  if (status_code == 401 || status_code == 403) {
    return absl::PermissionDeniedError(message);
  }
  return absl::InvalidArgumentError(message);
}

}  // namespace telemetry_relay
