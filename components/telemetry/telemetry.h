/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef COMPONENTS_TELEMETRY_TELEMETRY_H_
#define COMPONENTS_TELEMETRY_TELEMETRY_H_

#include <string>

#include "absl/time/time.h"
#include "opentelemetry/nostd/shared_ptr.h"
#include "opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h"
#include "opentelemetry/sdk/resource/resource.h"
#include "opentelemetry/trace/tracer.h"

namespace telemetry_relay {

// Names the relay's own spans and meters. Must be called before any
// `MetricsRecorder` is created.
void InitTelemetry(std::string service_name, std::string build_version);

// Builds the resource attached to everything the relay reports about itself.
opentelemetry::sdk::resource::Resource CreateSelfResource(
    const std::string& service_name, const std::string& build_version);

// Installs an SDK meter provider. Until this is called all metrics recording
// is a no-op.
void ConfigureMetrics(
    opentelemetry::sdk::resource::Resource resource,
    const opentelemetry::sdk::metrics::PeriodicExportingMetricReaderOptions&
        options);

// Installs an SDK tracer provider. Until this is called all tracing is a
// no-op.
void ConfigureTracer(opentelemetry::sdk::resource::Resource resource);

// Reader options exporting every `interval`.
opentelemetry::sdk::metrics::PeriodicExportingMetricReaderOptions
MetricReaderOptions(absl::Duration interval);

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> GetTracer();

}  // namespace telemetry_relay

#endif  // COMPONENTS_TELEMETRY_TELEMETRY_H_
