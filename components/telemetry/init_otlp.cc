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

#include <memory>
#include <utility>

#include "components/telemetry/init.h"
#include "opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h"
#include "opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h"
#include "opentelemetry/sdk/trace/random_id_generator_factory.h"

namespace telemetry_relay {

namespace metric_sdk = opentelemetry::sdk::metrics;

// The collector endpoint comes from the standard OTEL_EXPORTER_OTLP_ENDPOINT
// environment variable.
std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> CreateSpanExporter() {
  return opentelemetry::exporter::otlp::OtlpGrpcExporterFactory::Create();
}

std::unique_ptr<opentelemetry::sdk::trace::IdGenerator> CreateIdGenerator() {
  return opentelemetry::sdk::trace::RandomIdGeneratorFactory::Create();
}

std::unique_ptr<metric_sdk::MetricReader> CreatePeriodicExportingMetricReader(
    const metric_sdk::PeriodicExportingMetricReaderOptions& options) {
  return std::make_unique<metric_sdk::PeriodicExportingMetricReader>(
      opentelemetry::exporter::otlp::OtlpGrpcMetricExporterFactory::Create(),
      options);
}

}  // namespace telemetry_relay
