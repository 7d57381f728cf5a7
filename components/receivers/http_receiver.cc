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

#include "components/receivers/http_receiver.h"

#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "google/protobuf/util/json_util.h"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

enum class Encoding { kProtobuf, kJson };

// Seconds a client should wait after a 429.
constexpr absl::string_view kRetryAfterSeconds = "1";

absl::optional<Encoding> ParseEncoding(absl::string_view content_type) {
  const size_t params = content_type.find(';');
  std::string media_type = absl::AsciiStrToLower(
      absl::StripAsciiWhitespace(content_type.substr(0, params)));
  if (media_type == kContentTypeProtobuf ||
      media_type == "application/protobuf") {
    return Encoding::kProtobuf;
  }
  if (media_type == kContentTypeJson) {
    return Encoding::kJson;
  }
  return absl::nullopt;
}

HttpResponse ErrorResponse(int status_code, absl::string_view message) {
  v1::ExportResponse response;
  response.set_error_message(std::string(message));
  std::string body;
  if (!google::protobuf::util::MessageToJsonString(response, &body).ok()) {
    return TextResponse(status_code, absl::StrCat(message, "\n"));
  }
  return JsonResponse(status_code, std::move(body));
}

absl::StatusOr<v1::ExportRequest> DecodeBody(const HttpRequest& request,
                                             Encoding encoding) {
  v1::ExportRequest export_request;
  if (encoding == Encoding::kProtobuf) {
    if (!export_request.ParseFromString(request.body)) {
      return absl::InvalidArgumentError("body is not a valid ExportRequest");
    }
    return export_request;
  }
  const auto status =
      google::protobuf::util::JsonStringToMessage(request.body,
                                                  &export_request);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid JSON body: ", std::string(status.message())));
  }
  return export_request;
}

HttpServerOptions ServerOptions(const ReceiverConfig& config) {
  HttpServerOptions options;
  options.max_body_bytes = GetMaxRequestBytes(config);
  return options;
}

}  // namespace

HttpResponse IngestResultToHttp(
    const absl::StatusOr<v1::ExportResponse>& result) {
  if (result.ok()) {
    std::string body;
    if (!google::protobuf::util::MessageToJsonString(*result, &body).ok()) {
      return ErrorResponse(500, "cannot encode response");
    }
    return JsonResponse(200, std::move(body));
  }
  const absl::Status& status = result.status();
  switch (status.code()) {
    case absl::StatusCode::kInvalidArgument:
    case absl::StatusCode::kFailedPrecondition:
      return ErrorResponse(400, status.message());
    case absl::StatusCode::kResourceExhausted: {
      HttpResponse response = ErrorResponse(429, status.message());
      response.headers.emplace_back("Retry-After",
                                    std::string(kRetryAfterSeconds));
      return response;
    }
    case absl::StatusCode::kUnavailable:
      return ErrorResponse(503, status.message());
    default:
      return ErrorResponse(500, status.message());
  }
}

HttpReceiver::HttpReceiver(ReceiverConfig config, IngestHandler& handler)
    : config_(std::move(config)),
      handler_(handler),
      server_(config_.name(),
              [this](const HttpRequest& request) { return Handle(request); },
              ServerOptions(config_)) {}

absl::Status HttpReceiver::Start() {
  if (absl::Status status = server_.Start(config_.endpoint()); !status.ok()) {
    return status;
  }
  LOG(INFO) << "HTTP receiver " << config_.name() << " listening on port "
            << server_.port();
  return absl::OkStatus();
}

HttpResponse HttpReceiver::Handle(const HttpRequest& request) {
  absl::optional<Signal> only;
  if (request.path == kTracesPath) {
    only = Signal::kTraces;
  } else if (request.path == kMetricsPath) {
    only = Signal::kMetrics;
  } else if (request.path != kExportPath) {
    return ErrorResponse(404, "unknown path");
  }
  if (request.method != "POST") {
    HttpResponse response = ErrorResponse(405, "only POST is supported");
    response.headers.emplace_back("Allow", "POST");
    return response;
  }
  const absl::optional<Encoding> encoding =
      ParseEncoding(request.Header("content-type"));
  if (!encoding.has_value()) {
    return ErrorResponse(
        415, absl::StrCat("unsupported content type '",
                          request.Header("content-type"), "'"));
  }
  absl::StatusOr<v1::ExportRequest> export_request =
      DecodeBody(request, *encoding);
  if (!export_request.ok()) {
    handler_.CountRejected(export_request.status());
    return IngestResultToHttp(export_request.status());
  }
  return IngestResultToHttp(handler_.Handle(*std::move(export_request), only));
}

}  // namespace telemetry_relay
