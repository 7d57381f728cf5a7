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

#ifndef COMPONENTS_HEALTH_HEALTH_REPORTER_H_
#define COMPONENTS_HEALTH_HEALTH_REPORTER_H_

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "components/exporters/exporter.h"
#include "components/pipeline/memory_limiter.h"
#include "components/receivers/receiver.h"
#include "components/util/sleepfor.h"

namespace telemetry_relay {

struct MonitoredExporter {
  std::string name;
  Exporter* exporter = nullptr;
  // Does not gate readiness and is never checked.
  bool best_effort = false;
};

struct Readiness {
  bool ready = false;
  // Why the relay is not ready, empty when it is.
  std::vector<std::string> reasons;
};

// Decides whether the relay is ready to take traffic: every receiver
// listens, every gating exporter passed its connectivity check once, and no
// memory limiter is hard limited.
//
// Connectivity checks run on one thread per gating exporter and retry with
// exponential backoff until they succeed or `Stop` is called.
class HealthReporter {
 public:
  HealthReporter(std::vector<const Receiver*> receivers,
                 std::vector<MonitoredExporter> exporters,
                 std::vector<const MemoryLimiter*> limiters,
                 std::unique_ptr<SleepFor> sleep_for =
                     std::make_unique<SleepFor>());
  ~HealthReporter();

  HealthReporter(const HealthReporter&) = delete;
  HealthReporter& operator=(const HealthReporter&) = delete;

  void StartConnectivityChecks();

  // Interrupts pending checks and joins their threads.
  void Stop();

  Readiness GetReadiness() const;

  bool IsReachable(absl::string_view exporter) const;

 private:
  void CheckUntilReachable(const MonitoredExporter& exporter);

  const std::vector<const Receiver*> receivers_;
  const std::vector<MonitoredExporter> exporters_;
  const std::vector<const MemoryLimiter*> limiters_;
  std::unique_ptr<SleepFor> sleep_for_;
  std::vector<std::thread> threads_;
  bool stopped_ = false;

  mutable absl::Mutex mutex_;
  absl::flat_hash_set<std::string> reachable_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_HEALTH_HEALTH_REPORTER_H_
