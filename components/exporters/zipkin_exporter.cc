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

#include "components/exporters/zipkin_exporter.h"

#include <algorithm>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "components/config/pipeline_config.h"
#include "nlohmann/json.hpp"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

constexpr uint64_t kNanosPerMicro = 1000;

// Zipkin has no internal kind; such spans carry no kind at all.
const char* ZipkinKind(v1::Span::Kind kind) {
  switch (kind) {
    case v1::Span::KIND_SERVER:
      return "SERVER";
    case v1::Span::KIND_CLIENT:
      return "CLIENT";
    case v1::Span::KIND_PRODUCER:
      return "PRODUCER";
    case v1::Span::KIND_CONSUMER:
      return "CONSUMER";
    default:
      return nullptr;
  }
}

nlohmann::json ToZipkinSpan(const v1::Record& record) {
  const v1::Span& span = record.span();
  nlohmann::json tags = nlohmann::json::object();
  for (const auto& [key, value] : record.resource()) {
    tags[key] = AttributeValueToString(value);
  }
  for (const auto& [key, value] : span.attributes()) {
    tags[key] = AttributeValueToString(value);
  }
  switch (span.status().code()) {
    case v1::SpanStatus::CODE_OK:
      tags["otel.status_code"] = "OK";
      break;
    case v1::SpanStatus::CODE_ERROR:
      tags["otel.status_code"] = "ERROR";
      tags["error"] =
          span.status().message().empty() ? "true" : span.status().message();
      break;
    default:
      break;
  }

  nlohmann::json zipkin_span = {
      {"traceId", absl::AsciiStrToLower(span.trace_id())},
      {"id", absl::AsciiStrToLower(span.span_id())},
      {"name", span.name()},
      {"timestamp", span.start_time_unix_nano() / kNanosPerMicro},
      // Zipkin rejects zero durations.
      {"duration",
       std::max<uint64_t>(
           1, (span.end_time_unix_nano() - span.start_time_unix_nano()) /
                  kNanosPerMicro)},
      {"localEndpoint", {{"serviceName", span.service_name()}}},
      {"tags", std::move(tags)},
  };
  if (!span.parent_span_id().empty()) {
    zipkin_span["parentId"] = absl::AsciiStrToLower(span.parent_span_id());
  }
  if (const char* kind = ZipkinKind(span.kind()); kind != nullptr) {
    zipkin_span["kind"] = kind;
  }
  return zipkin_span;
}

}  // namespace

std::string ToZipkinJson(const TelemetryBatch& batch) {
  nlohmann::json spans = nlohmann::json::array();
  for (const v1::Record& record : batch.records()) {
    if (record.has_span()) {
      spans.push_back(ToZipkinSpan(record));
    }
  }
  return spans.dump();
}

absl::Status ZipkinExporter::Export(const TelemetryBatch& batch) {
  if (batch.CountSignal(Signal::kTraces) == 0) {
    return absl::OkStatus();
  }
  const ExporterConfig settings = settings_();
  const absl::StatusOr<HttpResponse> response =
      http_client_->Post(settings.endpoint(), kContentTypeJson,
                         ToZipkinJson(batch), GetExportTimeout(settings));
  if (!response.ok()) {
    return response.status();
  }
  return StatusFromHttpCode(response->status_code, response->body);
}

absl::Status ZipkinExporter::CheckConnectivity() {
  const ExporterConfig settings = settings_();
  // Collectors answer GET on the span path with 405; any answer will do.
  return http_client_->Get(settings.endpoint(), GetExportTimeout(settings))
      .status();
}

}  // namespace telemetry_relay
