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

#include "components/exporters/otlp_http_exporter.h"

#include <string>

#include "components/config/pipeline_config.h"
#include "components/errors/error_tag.h"
#include "google/protobuf/util/json_util.h"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kJsonEncodeExportRequest = 1,
  kProtoEncodeExportRequest = 2,
};

}  // namespace

absl::Status OtlpHttpExporter::Export(const TelemetryBatch& batch) {
  if (batch.empty()) {
    return absl::OkStatus();
  }
  const ExporterConfig settings = settings_();
  const v1::ExportRequest request = batch.ToRequest();
  std::string body;
  absl::string_view content_type;
  if (settings.encoding() == ExporterConfig::ENCODING_JSON) {
    const auto status =
        google::protobuf::util::MessageToJsonString(request, &body);
    if (!status.ok()) {
      return StatusWithErrorTag(
          absl::InvalidArgumentError(std::string(status.message())),
          __FILE__, ErrorTag::kJsonEncodeExportRequest);
    }
    content_type = kContentTypeJson;
  } else {
    if (!request.SerializeToString(&body)) {
      return StatusWithErrorTag(
          absl::InvalidArgumentError("Failed to serialize ExportRequest"),
          __FILE__, ErrorTag::kProtoEncodeExportRequest);
    }
    content_type = kContentTypeProtobuf;
  }
  const absl::StatusOr<HttpResponse> response = http_client_->Post(
      settings.endpoint(), content_type, body, GetExportTimeout(settings));
  if (!response.ok()) {
    return response.status();
  }
  return StatusFromHttpCode(response->status_code, response->body);
}

absl::Status OtlpHttpExporter::CheckConnectivity() {
  const ExporterConfig settings = settings_();
  return http_client_->Get(settings.endpoint(), GetExportTimeout(settings))
      .status();
}

}  // namespace telemetry_relay
