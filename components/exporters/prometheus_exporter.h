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

#ifndef COMPONENTS_EXPORTERS_PROMETHEUS_EXPORTER_H_
#define COMPONENTS_EXPORTERS_PROMETHEUS_EXPORTER_H_

#include <cstdint>
#include <memory>

#include "components/exporters/exporter.h"
#include "components/exporters/metric_store.h"
#include "components/util/periodic_closure.h"
#include "prometheus/exposer.h"

namespace telemetry_relay {

// Pull-based metrics destination: keeps the latest value of every series and
// serves them on `GET /metrics` of its own listener for Prometheus to
// scrape. Series that stop being updated expire in the background whether
// or not anyone scrapes.
class PrometheusExporter : public Exporter {
 public:
  explicit PrometheusExporter(ExporterSettingsProvider settings);

  ~PrometheusExporter() override { Shutdown(); }

  // Binds the exporter's endpoint and starts expiring stale series.
  absl::Status Start() override;

  absl::Status Export(const TelemetryBatch& batch) override;

  absl::Status CheckConnectivity() override { return absl::OkStatus(); }

  void Shutdown() override;

  // Bound port, for endpoints with port 0.
  uint16_t port() const override;
  MetricStore& store() { return *store_; }

 private:
  void ExpireStaleSeries();

  const ExporterSettingsProvider settings_;
  const std::shared_ptr<MetricStore> store_;
  std::unique_ptr<prometheus::Exposer> exposer_;
  std::unique_ptr<PeriodicClosure> expiry_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_PROMETHEUS_EXPORTER_H_
