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

#include "components/health/health_reporter.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/errors/retry.h"

namespace telemetry_relay {

HealthReporter::HealthReporter(std::vector<const Receiver*> receivers,
                               std::vector<MonitoredExporter> exporters,
                               std::vector<const MemoryLimiter*> limiters,
                               std::unique_ptr<SleepFor> sleep_for)
    : receivers_(std::move(receivers)),
      exporters_(std::move(exporters)),
      limiters_(std::move(limiters)),
      sleep_for_(std::move(sleep_for)) {}

HealthReporter::~HealthReporter() { Stop(); }

void HealthReporter::StartConnectivityChecks() {
  for (const MonitoredExporter& exporter : exporters_) {
    if (exporter.best_effort) {
      VLOG(1) << "Exporter " << exporter.name
              << " is best effort, skipping its connectivity check";
      continue;
    }
    threads_.emplace_back(
        [this, &exporter] { CheckUntilReachable(exporter); });
  }
}

void HealthReporter::CheckUntilReachable(const MonitoredExporter& exporter) {
  const absl::Status status = RetryUntilOk(
      [&exporter] { return exporter.exporter->CheckConnectivity(); },
      absl::StrCat("connectivity check of ", exporter.name),
      LogMetricsNoOpCallback(), *sleep_for_);
  if (!status.ok()) {
    VLOG(1) << "Connectivity check of " << exporter.name
            << " stopped: " << status;
    return;
  }
  LOG(INFO) << "Exporter " << exporter.name << " is reachable";
  absl::MutexLock lock(&mutex_);
  reachable_.insert(exporter.name);
}

void HealthReporter::Stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  if (const absl::Status status = sleep_for_->Stop(); !status.ok()) {
    LOG(WARNING) << "Failed to interrupt connectivity checks: " << status;
  }
  for (std::thread& thread : threads_) {
    thread.join();
  }
  threads_.clear();
}

bool HealthReporter::IsReachable(absl::string_view exporter) const {
  absl::MutexLock lock(&mutex_);
  return reachable_.contains(exporter);
}

Readiness HealthReporter::GetReadiness() const {
  Readiness readiness;
  for (const Receiver* receiver : receivers_) {
    if (!receiver->IsListening()) {
      readiness.reasons.push_back(
          absl::StrCat("receiver ", receiver->name(), " is not listening"));
    }
  }
  for (const MonitoredExporter& exporter : exporters_) {
    if (!exporter.best_effort && !IsReachable(exporter.name)) {
      readiness.reasons.push_back(
          absl::StrCat("exporter ", exporter.name,
                       " has not passed its connectivity check"));
    }
  }
  for (const MemoryLimiter* limiter : limiters_) {
    if (limiter->state() == LimiterState::kHardLimited) {
      readiness.reasons.push_back(absl::StrCat("memory limiter ",
                                               limiter->name(),
                                               " is hard limited"));
    }
  }
  readiness.ready = readiness.reasons.empty();
  return readiness;
}

}  // namespace telemetry_relay
