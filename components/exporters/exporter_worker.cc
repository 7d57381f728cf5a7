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

#include "components/exporters/exporter_worker.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/config/pipeline_config.h"
#include "components/telemetry/tracing.h"

namespace telemetry_relay {

ExporterWorker::ExporterWorker(std::string name,
                               std::unique_ptr<Exporter> exporter,
                               ExporterSettingsProvider settings,
                               RelayStats& stats,
                               MetricsRecorder& metrics_recorder,
                               std::unique_ptr<SleepFor> sleep_for)
    : name_(std::move(name)),
      exporter_(std::move(exporter)),
      settings_(std::move(settings)),
      stats_(stats),
      counters_(stats.ForExporter(name_)),
      metrics_recorder_(metrics_recorder),
      sleep_for_(std::move(sleep_for)),
      metrics_callback_([this](const absl::Status& status, int count) {
        metrics_recorder_.IncrementEventStatus(absl::StrCat("export.", name_),
                                               status, count);
      }) {}

ExporterWorker::~ExporterWorker() { Shutdown(absl::Now()); }

void ExporterWorker::Start() {
  thread_ = std::thread([this] { Run(); });
}

bool ExporterWorker::Enqueue(ExportJobPtr job) {
  const size_t records = job->batch->size();
  const size_t capacity = GetQueueSize(settings_());
  {
    absl::MutexLock lock(&mutex_);
    if (draining_) {
      stats_.AddShutdownDropped(records);
      return false;
    }
    if (queue_.size() < capacity) {
      queue_.push_back(std::move(job));
      return true;
    }
  }
  ++counters_.dropped_batches;
  counters_.dropped_records += records;
  LOG_EVERY_N_SEC(WARNING, 10) << "Exporter " << name_
                               << " queue is full, dropping " << records
                               << " records";
  return false;
}

void ExporterWorker::Shutdown(absl::Time deadline) {
  std::deque<ExportJobPtr> leftovers;
  {
    absl::MutexLock lock(&mutex_);
    if (stopping_) {
      return;
    }
    draining_ = true;
    if (thread_.joinable()) {
      mutex_.AwaitWithDeadline(absl::Condition(this, &ExporterWorker::IsIdle),
                               deadline);
    }
    stopping_ = true;
    leftovers.swap(queue_);
  }
  // Interrupts a backoff in progress; the batch counts as dropped.
  if (const absl::Status status = sleep_for_->Stop(); !status.ok()) {
    LOG(WARNING) << "Exporter " << name_ << " backoff not interrupted: "
                 << status;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  uint64_t dropped = 0;
  for (const ExportJobPtr& job : leftovers) {
    dropped += job->batch->size();
  }
  if (dropped > 0) {
    stats_.AddShutdownDropped(dropped);
    LOG(WARNING) << "Exporter " << name_ << " dropped " << dropped
                 << " queued records at shutdown";
  }
  exporter_->Shutdown();
}

size_t ExporterWorker::queue_depth() const {
  absl::MutexLock lock(&mutex_);
  return queue_.size();
}

bool ExporterWorker::HasJobOrStopping() const {
  return stopping_ || !queue_.empty();
}

bool ExporterWorker::IsIdle() const { return queue_.empty() && !busy_; }

void ExporterWorker::Run() {
  while (true) {
    ExportJobPtr job;
    {
      absl::MutexLock lock(&mutex_);
      mutex_.Await(absl::Condition(this, &ExporterWorker::HasJobOrStopping));
      if (stopping_) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }
    Deliver(*job);
    // Releases this destination's share of the reserved memory.
    job.reset();
    absl::MutexLock lock(&mutex_);
    busy_ = false;
  }
}

void ExporterWorker::Deliver(const ExportJob& job) {
  const TelemetryBatch& batch = *job.batch;
  const RetrySettings retry = GetRetrySettings(settings_());
  ScopeLatencyRecorder latency(absl::StrCat("export.", name_),
                               metrics_recorder_);
  const absl::Status status = RetryWithMax(
      [this, &batch] {
        ++counters_.attempts;
        return TraceWithStatus(
            [this, &batch] { return exporter_->Export(batch); }, "Export",
            {{"exporter",
              opentelemetry::nostd::string_view(name_.data(), name_.size())},
             {"records", static_cast<int64_t>(batch.size())}});
      },
      absl::StrCat("Export to ", name_), retry.max_attempts, metrics_callback_,
      *sleep_for_, retry.backoff);
  if (status.ok()) {
    ++counters_.sent_batches;
    counters_.sent_records += batch.size();
    return;
  }
  if (absl::IsCancelled(status)) {
    stats_.AddShutdownDropped(batch.size());
    return;
  }
  ++counters_.failed_batches;
  counters_.failed_records += batch.size();
  LOG(ERROR) << "Dropping " << batch.size() << " records for exporter "
             << name_ << ": " << status;
}

}  // namespace telemetry_relay
