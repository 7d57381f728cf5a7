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

#include <iostream>
#include <memory>
#include <utility>

#include "components/telemetry/init.h"
#include "opentelemetry/exporters/ostream/metric_exporter.h"
#include "opentelemetry/exporters/ostream/span_exporter_factory.h"
#include "opentelemetry/sdk/trace/random_id_generator_factory.h"

namespace telemetry_relay {

namespace metric_sdk = opentelemetry::sdk::metrics;

// Self telemetry shares stderr with the log so that stdout stays free for
// the LOGGING exporter.
std::unique_ptr<opentelemetry::sdk::trace::SpanExporter> CreateSpanExporter() {
  return opentelemetry::exporter::trace::OStreamSpanExporterFactory::Create(
      std::cerr);
}

std::unique_ptr<opentelemetry::sdk::trace::IdGenerator> CreateIdGenerator() {
  return opentelemetry::sdk::trace::RandomIdGeneratorFactory::Create();
}

std::unique_ptr<metric_sdk::MetricReader> CreatePeriodicExportingMetricReader(
    const metric_sdk::PeriodicExportingMetricReaderOptions& options) {
  std::unique_ptr<metric_sdk::PushMetricExporter> exporter =
      std::make_unique<opentelemetry::exporter::metrics::OStreamMetricExporter>(
          std::cerr);
  return std::make_unique<metric_sdk::PeriodicExportingMetricReader>(
      std::move(exporter), options);
}

}  // namespace telemetry_relay
