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

#ifndef COMPONENTS_EXPORTERS_EXPORTER_WORKER_H_
#define COMPONENTS_EXPORTERS_EXPORTER_WORKER_H_

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "components/errors/retry.h"
#include "components/exporters/exporter.h"
#include "components/pipeline/relay_stats.h"
#include "components/telemetry/metrics_recorder.h"
#include "components/util/sleepfor.h"

namespace telemetry_relay {

// Owns one destination: a bounded queue of batches drained by a dedicated
// thread that retries each batch with the exporter's backoff policy. A slow
// or failing destination only ever delays its own queue.
class ExporterWorker {
 public:
  ExporterWorker(std::string name, std::unique_ptr<Exporter> exporter,
                 ExporterSettingsProvider settings, RelayStats& stats,
                 MetricsRecorder& metrics_recorder,
                 std::unique_ptr<SleepFor> sleep_for =
                     std::make_unique<SleepFor>());
  ~ExporterWorker();

  ExporterWorker(const ExporterWorker&) = delete;
  ExporterWorker& operator=(const ExporterWorker&) = delete;

  void Start();

  // Queues `job`. When the queue is full or the worker shuts down, the batch
  // is dropped for this destination only, counted, and false is returned.
  bool Enqueue(ExportJobPtr job);

  // Lets queued batches drain until `deadline`, then interrupts retries and
  // drops what is left. Dropped records are counted as shutdown drops.
  void Shutdown(absl::Time deadline);

  const std::string& name() const { return name_; }
  Exporter& exporter() { return *exporter_; }
  size_t queue_depth() const;

 private:
  void Run();
  void Deliver(const ExportJob& job);
  bool HasJobOrStopping() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  bool IsIdle() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const std::string name_;
  std::unique_ptr<Exporter> exporter_;
  const ExporterSettingsProvider settings_;
  RelayStats& stats_;
  ExporterCounters& counters_;
  MetricsRecorder& metrics_recorder_;
  std::unique_ptr<SleepFor> sleep_for_;
  const MetricsCallback metrics_callback_;

  mutable absl::Mutex mutex_;
  std::deque<ExportJobPtr> queue_ ABSL_GUARDED_BY(mutex_);
  bool busy_ ABSL_GUARDED_BY(mutex_) = false;
  bool draining_ ABSL_GUARDED_BY(mutex_) = false;
  bool stopping_ ABSL_GUARDED_BY(mutex_) = false;
  std::thread thread_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_EXPORTER_WORKER_H_
