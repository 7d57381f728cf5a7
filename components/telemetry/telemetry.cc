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

#include "components/telemetry/telemetry.h"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "components/telemetry/init.h"
#include "components/telemetry/telemetry_provider.h"
#include "opentelemetry/metrics/provider.h"
#include "opentelemetry/sdk/metrics/meter_provider.h"
#include "opentelemetry/sdk/metrics/view/view_registry.h"
#include "opentelemetry/sdk/trace/batch_span_processor_factory.h"
#include "opentelemetry/sdk/trace/batch_span_processor_options.h"
#include "opentelemetry/sdk/trace/samplers/always_on_factory.h"
#include "opentelemetry/sdk/trace/tracer_provider_factory.h"
#include "opentelemetry/trace/provider.h"

namespace metric_sdk = opentelemetry::sdk::metrics;
namespace metrics_api = opentelemetry::metrics;
namespace nostd = opentelemetry::nostd;
using opentelemetry::sdk::resource::Resource;
using opentelemetry::sdk::resource::ResourceAttributes;
using opentelemetry::sdk::trace::AlwaysOnSamplerFactory;
using opentelemetry::sdk::trace::BatchSpanProcessorFactory;
using opentelemetry::sdk::trace::BatchSpanProcessorOptions;
using opentelemetry::sdk::trace::TracerProviderFactory;
using opentelemetry::trace::Tracer;
using opentelemetry::trace::TracerProvider;

namespace telemetry_relay {

void InitTelemetry(std::string service_name, std::string build_version) {
  TelemetryProvider::Init(std::move(service_name), std::move(build_version));
}

Resource CreateSelfResource(const std::string& service_name,
                            const std::string& build_version) {
  return Resource::Create(ResourceAttributes{
      {"service.name", service_name},
      {"service.version", build_version},
  });
}

metric_sdk::PeriodicExportingMetricReaderOptions MetricReaderOptions(
    absl::Duration interval) {
  metric_sdk::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis =
      std::chrono::milliseconds(absl::ToInt64Milliseconds(interval));
  // The timeout must stay below the interval.
  options.export_timeout_millis =
      std::chrono::milliseconds(absl::ToInt64Milliseconds(interval) / 2);
  return options;
}

void ConfigureMetrics(
    Resource resource,
    const metric_sdk::PeriodicExportingMetricReaderOptions& options) {
  auto provider = std::make_shared<metric_sdk::MeterProvider>(
      std::make_unique<metric_sdk::ViewRegistry>(), std::move(resource));
  provider->AddMetricReader(CreatePeriodicExportingMetricReader(options));
  metrics_api::Provider::SetMeterProvider(
      std::shared_ptr<metrics_api::MeterProvider>(std::move(provider)));
}

void ConfigureTracer(Resource resource) {
  // Batching keeps span export off the ingestion path.
  auto processor = BatchSpanProcessorFactory::Create(
      CreateSpanExporter(), BatchSpanProcessorOptions{});
  std::shared_ptr<TracerProvider> provider = TracerProviderFactory::Create(
      std::move(processor), resource, AlwaysOnSamplerFactory::Create(),
      CreateIdGenerator());
  opentelemetry::trace::Provider::SetTracerProvider(provider);
}

nostd::shared_ptr<Tracer> GetTracer() {
  return TelemetryProvider::GetInstance().GetTracer();
}

}  // namespace telemetry_relay
