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

#ifndef COMPONENTS_SERVER_SERVER_H_
#define COMPONENTS_SERVER_SERVER_H_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "components/config/config_store.h"
#include "components/exporters/exporter_worker.h"
#include "components/health/health_reporter.h"
#include "components/health/health_service.h"
#include "components/pipeline/memory_limiter.h"
#include "components/pipeline/pipeline.h"
#include "components/pipeline/relay_stats.h"
#include "components/pipeline/router.h"
#include "components/receivers/ingest_handler.h"
#include "components/receivers/receiver.h"
#include "components/telemetry/metrics_recorder.h"
#include "components/util/periodic_closure.h"

namespace telemetry_relay {

struct ServerOptions {
  // Workers per pipeline when the config does not set `service.num_workers`.
  int num_workers = 2;
  // Time every stage gets to flush on shutdown.
  absl::Duration shutdown_grace_period = absl::Seconds(5);
  // Period of the stats log line. Zero disables it.
  absl::Duration stats_log_interval = absl::ZeroDuration();
};

// Assembles the relay from the active configuration of `config_store` and
// owns every component.
class Server {
 public:
  Server(std::unique_ptr<ConfigStore> config_store,
         MetricsRecorder& metrics_recorder, ServerOptions options);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Builds and starts exporters, pipelines, receivers and the health service,
  // in that order, so that nothing is accepted before it can be delivered.
  absl::Status Init();

  // Stops accepting, stops the receivers, then lets pipelines and exporters
  // drain within the grace period. Whatever is left is dropped and counted.
  // Safe to call more than once.
  void GracefulShutdown();

  const RelayStats& stats() const { return stats_; }
  Readiness GetReadiness() const;

  // Bound ports, for endpoints configured with port 0.
  absl::StatusOr<uint16_t> ReceiverPort(absl::string_view receiver) const;
  absl::StatusOr<uint16_t> ExporterPort(absl::string_view exporter) const;
  uint16_t health_port() const;

 private:
  absl::Status CreateLimiters(const PipelineConfig& config);
  absl::Status CreateExporters(const PipelineConfig& config);
  absl::Status CreatePipelines(const PipelineConfig& config);
  absl::Status CreateReceivers(const PipelineConfig& config);
  absl::Status StartHealthService(const PipelineConfig& config);
  PipelineStages StagesOf(const PipelineDefinition& pipeline) const;
  void LogStats() const;

  std::unique_ptr<ConfigStore> config_store_;
  MetricsRecorder& metrics_recorder_;
  const ServerOptions options_;

  RelayStats stats_;
  Router router_{stats_};
  std::map<std::string, std::unique_ptr<MemoryLimiter>> limiters_;
  std::map<std::string, std::unique_ptr<ExporterWorker>> workers_;
  std::vector<std::unique_ptr<Pipeline>> pipelines_;
  std::vector<std::unique_ptr<IngestHandler>> handlers_;
  std::vector<std::unique_ptr<Receiver>> receivers_;
  std::unique_ptr<HealthReporter> health_reporter_;
  std::unique_ptr<HealthService> health_service_;
  std::unique_ptr<PeriodicClosure> stats_logger_;
  bool shut_down_ = false;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_SERVER_SERVER_H_
