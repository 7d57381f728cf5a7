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

#include "components/exporters/exporter_factory.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"
#include "components/exporters/grpc_exporter.h"
#include "components/exporters/logging_exporter.h"
#include "components/exporters/otlp_http_exporter.h"
#include "components/exporters/prometheus_exporter.h"
#include "components/exporters/zipkin_exporter.h"
#include "components/http/http_client.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kUnknownProtocol = 1,
};

}  // namespace

absl::StatusOr<std::unique_ptr<Exporter>> CreateExporter(
    ExporterSettingsProvider settings) {
  const config::v1::ExporterConfig config = settings();
  switch (config.protocol()) {
    case config::v1::ExporterConfig::PROTOCOL_ZIPKIN:
      return std::make_unique<ZipkinExporter>(std::move(settings),
                                              HttpClient::Create());
    case config::v1::ExporterConfig::PROTOCOL_OTLP_HTTP:
      return std::make_unique<OtlpHttpExporter>(std::move(settings),
                                                HttpClient::Create());
    case config::v1::ExporterConfig::PROTOCOL_GRPC:
      return GrpcExporter::Create(std::move(settings));
    case config::v1::ExporterConfig::PROTOCOL_PROMETHEUS:
      return std::make_unique<PrometheusExporter>(std::move(settings));
    case config::v1::ExporterConfig::PROTOCOL_LOGGING:
      return std::make_unique<LoggingExporter>(config.name());
    default:
      return StatusWithErrorTag(
          absl::InvalidArgumentError(absl::StrCat(
              "exporter ", config.name(), ": unsupported protocol ",
              config::v1::ExporterConfig::Protocol_Name(config.protocol()))),
          __FILE__, ErrorTag::kUnknownProtocol);
  }
}

}  // namespace telemetry_relay
