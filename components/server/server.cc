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

#include "components/server/server.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"
#include "components/exporters/exporter_factory.h"
#include "components/exporters/fanout.h"
#include "components/receivers/grpc_receiver.h"
#include "components/receivers/http_receiver.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kUnknownReceiverProtocol = 1,
  kUnknownSignal = 2,
  kUnknownName = 3,
};

absl::Status UnknownName(absl::string_view kind, absl::string_view name) {
  return StatusWithErrorTag(
      absl::NotFoundError(absl::StrCat("no ", kind, " named ", name)),
      __FILE__, ErrorTag::kUnknownName);
}

}  // namespace

Server::Server(std::unique_ptr<ConfigStore> config_store,
               MetricsRecorder& metrics_recorder, ServerOptions options)
    : config_store_(std::move(config_store)),
      metrics_recorder_(metrics_recorder),
      options_(std::move(options)) {}

Server::~Server() { GracefulShutdown(); }

absl::Status Server::Init() {
  // Wiring is fixed for the lifetime of the process; only tunables reload.
  const std::shared_ptr<const PipelineConfig> config = config_store_->Get();
  if (absl::Status status = CreateLimiters(*config); !status.ok()) {
    return status;
  }
  if (absl::Status status = CreateExporters(*config); !status.ok()) {
    return status;
  }
  if (absl::Status status = CreatePipelines(*config); !status.ok()) {
    return status;
  }
  if (absl::Status status = CreateReceivers(*config); !status.ok()) {
    return status;
  }
  if (absl::Status status = StartHealthService(*config); !status.ok()) {
    return status;
  }
  if (options_.stats_log_interval > absl::ZeroDuration()) {
    stats_logger_ = PeriodicClosure::Create("stats log");
    if (absl::Status status = stats_logger_->StartDelayed(
            options_.stats_log_interval, [this] { LogStats(); });
        !status.ok()) {
      return status;
    }
  }
  LOG(INFO) << "Relay started with " << receivers_.size() << " receivers, "
            << pipelines_.size() << " pipelines and " << workers_.size()
            << " exporters";
  return absl::OkStatus();
}

absl::Status Server::CreateLimiters(const PipelineConfig& config) {
  for (const ProcessorConfig& processor : config.processors()) {
    if (processor.processor_case() != ProcessorConfig::kMemoryLimiter) {
      continue;
    }
    const std::string& name = processor.name();
    limiters_[name] = std::make_unique<MemoryLimiter>(
        name,
        [store = config_store_.get(), name] {
          const std::shared_ptr<const PipelineConfig> active = store->Get();
          const ProcessorConfig* current = FindProcessor(*active, name);
          if (current == nullptr) {
            return MemoryLimits{};
          }
          return MemoryLimits{
              GetSoftLimitBytes(current->memory_limiter()),
              current->memory_limiter().hard_limit_bytes()};
        },
        stats_);
  }
  return absl::OkStatus();
}

absl::Status Server::CreateExporters(const PipelineConfig& config) {
  for (const ExporterConfig& exporter_config : config.exporters()) {
    const std::string& name = exporter_config.name();
    ExporterSettingsProvider settings = [store = config_store_.get(), name] {
      const std::shared_ptr<const PipelineConfig> active = store->Get();
      const ExporterConfig* current = FindExporter(*active, name);
      return current == nullptr ? ExporterConfig() : *current;
    };
    absl::StatusOr<std::unique_ptr<Exporter>> exporter =
        CreateExporter(settings);
    if (!exporter.ok()) {
      return exporter.status();
    }
    auto worker = std::make_unique<ExporterWorker>(
        name, *std::move(exporter), std::move(settings), stats_,
        metrics_recorder_);
    if (absl::Status status = worker->exporter().Start(); !status.ok()) {
      return status;
    }
    worker->Start();
    workers_[name] = std::move(worker);
  }
  return absl::OkStatus();
}

PipelineStages Server::StagesOf(const PipelineDefinition& pipeline) const {
  PipelineStages stages;
  const std::shared_ptr<const PipelineConfig> config = config_store_->Get();
  for (const std::string& name : pipeline.processors()) {
    const ProcessorConfig* processor = FindProcessor(*config, name);
    if (processor == nullptr) {
      continue;
    }
    switch (processor->processor_case()) {
      case ProcessorConfig::kMemoryLimiter:
        stages.memory_limiter = limiters_.at(name).get();
        break;
      case ProcessorConfig::kResource:
        stages.resource = [store = config_store_.get(), name] {
          const std::shared_ptr<const PipelineConfig> active = store->Get();
          const ProcessorConfig* current = FindProcessor(*active, name);
          return current == nullptr ? ResourceConfig() : current->resource();
        };
        break;
      case ProcessorConfig::kBatch:
        stages.batch = [store = config_store_.get(), name] {
          const std::shared_ptr<const PipelineConfig> active = store->Get();
          const ProcessorConfig* current = FindProcessor(*active, name);
          return current == nullptr ? BatchConfig() : current->batch();
        };
        break;
      case ProcessorConfig::PROCESSOR_NOT_SET:
        break;
    }
  }
  return stages;
}

absl::Status Server::CreatePipelines(const PipelineConfig& config) {
  const int num_workers = config.service().num_workers() > 0
                              ? static_cast<int>(config.service().num_workers())
                              : options_.num_workers;
  for (const PipelineDefinition& definition : config.pipelines()) {
    Signal signal;
    switch (definition.signal()) {
      case PipelineDefinition::SIGNAL_TRACES:
        signal = Signal::kTraces;
        break;
      case PipelineDefinition::SIGNAL_METRICS:
        signal = Signal::kMetrics;
        break;
      default:
        return StatusWithErrorTag(
            absl::InvalidArgumentError(
                absl::StrCat("pipeline ", definition.name(),
                             " has no signal")),
            __FILE__, ErrorTag::kUnknownSignal);
    }
    std::vector<ExporterWorker*> destinations;
    for (const std::string& exporter : definition.exporters()) {
      auto it = workers_.find(exporter);
      if (it == workers_.end()) {
        return UnknownName("exporter", exporter);
      }
      destinations.push_back(it->second.get());
    }
    auto pipeline = std::make_unique<Pipeline>(
        definition.name(), signal, StagesOf(definition),
        Fanout(std::move(destinations)), num_workers, stats_);
    pipeline->Start();
    for (const std::string& receiver : definition.receivers()) {
      router_.AddRoute(receiver, pipeline.get());
    }
    pipelines_.push_back(std::move(pipeline));
  }
  return absl::OkStatus();
}

absl::Status Server::CreateReceivers(const PipelineConfig& config) {
  for (const ReceiverConfig& receiver_config : config.receivers()) {
    handlers_.push_back(std::make_unique<IngestHandler>(
        receiver_config.name(), router_, stats_, metrics_recorder_));
    std::unique_ptr<Receiver> receiver;
    switch (receiver_config.protocol()) {
      case ReceiverConfig::PROTOCOL_GRPC:
        receiver =
            std::make_unique<GrpcReceiver>(receiver_config, *handlers_.back());
        break;
      case ReceiverConfig::PROTOCOL_HTTP:
        receiver =
            std::make_unique<HttpReceiver>(receiver_config, *handlers_.back());
        break;
      default:
        return StatusWithErrorTag(
            absl::InvalidArgumentError(
                absl::StrCat("receiver ", receiver_config.name(),
                             " has no protocol")),
            __FILE__, ErrorTag::kUnknownReceiverProtocol);
    }
    if (absl::Status status = receiver->Start(); !status.ok()) {
      return status;
    }
    receivers_.push_back(std::move(receiver));
  }
  return absl::OkStatus();
}

absl::Status Server::StartHealthService(const PipelineConfig& config) {
  std::vector<const Receiver*> receivers;
  for (const auto& receiver : receivers_) {
    receivers.push_back(receiver.get());
  }
  std::vector<MonitoredExporter> exporters;
  for (const ExporterConfig& exporter : config.exporters()) {
    exporters.push_back({exporter.name(),
                         &workers_.at(exporter.name())->exporter(),
                         exporter.best_effort()});
  }
  std::vector<const MemoryLimiter*> limiters;
  for (const auto& [name, limiter] : limiters_) {
    limiters.push_back(limiter.get());
  }
  health_reporter_ = std::make_unique<HealthReporter>(
      std::move(receivers), std::move(exporters), limiters);
  health_reporter_->StartConnectivityChecks();

  if (config.service().health_endpoint().empty()) {
    LOG(WARNING) << "No health endpoint configured";
    return absl::OkStatus();
  }
  health_service_ = std::make_unique<HealthService>(
      *health_reporter_, stats_, std::move(limiters), *config_store_);
  return health_service_->Start(config.service().health_endpoint());
}

void Server::GracefulShutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  const absl::Time deadline = absl::Now() + options_.shutdown_grace_period;
  LOG(INFO) << "Shutting down, grace period "
            << options_.shutdown_grace_period;
  router_.StopAccepting();
  for (const auto& receiver : receivers_) {
    receiver->Stop();
  }
  if (health_reporter_ != nullptr) {
    health_reporter_->Stop();
  }
  for (const auto& pipeline : pipelines_) {
    pipeline->Shutdown(deadline);
  }
  for (const auto& [name, worker] : workers_) {
    worker->Shutdown(deadline);
  }
  if (stats_logger_ != nullptr) {
    stats_logger_->Stop();
  }
  if (health_service_ != nullptr) {
    health_service_->Stop();
  }
  LogStats();
}

Readiness Server::GetReadiness() const {
  if (health_reporter_ == nullptr) {
    return Readiness{false, {"relay is not initialized"}};
  }
  return health_reporter_->GetReadiness();
}

absl::StatusOr<uint16_t> Server::ReceiverPort(
    absl::string_view receiver) const {
  for (const auto& candidate : receivers_) {
    if (candidate->name() == receiver) {
      return candidate->port();
    }
  }
  return UnknownName("receiver", receiver);
}

absl::StatusOr<uint16_t> Server::ExporterPort(
    absl::string_view exporter) const {
  auto it = workers_.find(std::string(exporter));
  if (it == workers_.end()) {
    return UnknownName("exporter", exporter);
  }
  return it->second->exporter().port();
}

uint16_t Server::health_port() const {
  return health_service_ == nullptr ? 0 : health_service_->port();
}

void Server::LogStats() const {
  const RelayStatsSnapshot stats = stats_.Snapshot();
  LOG(INFO) << "accepted=" << stats.accepted_records
            << " rejected_requests=" << stats.rejected_requests
            << " refused=" << stats.refused_records
            << " evicted=" << stats.evicted_records
            << " unrouted=" << stats.unrouted_records
            << " shutdown_dropped=" << stats.shutdown_dropped_records;
  for (const auto& [name, counters] : stats.exporters) {
    LOG(INFO) << "exporter " << name << ": sent=" << counters.sent_records
              << " failed=" << counters.failed_records
              << " dropped=" << counters.dropped_records
              << " attempts=" << counters.attempts;
  }
}

}  // namespace telemetry_relay
