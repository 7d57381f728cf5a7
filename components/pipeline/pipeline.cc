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

#include "components/pipeline/pipeline.h"

#include <utility>

#include "absl/log/log.h"

namespace telemetry_relay {

Pipeline::Pipeline(std::string name, Signal signal, PipelineStages stages,
                   Fanout fanout, size_t num_workers, RelayStats& stats)
    : name_(std::move(name)),
      signal_(signal),
      memory_limiter_(stages.memory_limiter),
      fanout_(std::move(fanout)),
      num_workers_(num_workers == 0 ? 1 : num_workers),
      stats_(stats) {
  if (stages.resource) {
    resource_processor_ =
        std::make_unique<ResourceProcessor>(std::move(stages.resource));
  }
  if (stages.batch) {
    batch_processor_ = std::make_unique<BatchProcessor>(
        name_, std::move(stages.batch), [this](PipelineBatch batch) {
          fanout_.Dispatch(std::move(batch.batch),
                           std::move(batch.reservations));
        });
  }
  if (memory_limiter_ != nullptr) {
    memory_limiter_->RegisterQueue(this);
  }
}

Pipeline::~Pipeline() {
  Shutdown(absl::Now());
  if (memory_limiter_ != nullptr) {
    memory_limiter_->UnregisterQueue(this);
  }
}

void Pipeline::Start() {
  if (batch_processor_ != nullptr) {
    batch_processor_->Start();
  }
  for (size_t i = 0; i < num_workers_; ++i) {
    workers_.emplace_back([this] { RunWorker(); });
  }
  LOG(INFO) << "Pipeline " << name_ << " (" << SignalName(signal_)
            << ") started with " << num_workers_ << " workers and "
            << fanout_.workers().size() << " exporters";
}

absl::StatusOr<PipelineBatch> Pipeline::Admit(TelemetryBatch batch) {
  PipelineBatch admitted;
  if (memory_limiter_ != nullptr) {
    absl::StatusOr<ReservationPtr> reservation =
        memory_limiter_->Reserve(batch.ByteSize(), batch.size());
    if (!reservation.ok()) {
      return reservation.status();
    }
    admitted.reservations.push_back(*std::move(reservation));
  }
  admitted.batch = std::move(batch);
  return admitted;
}

void Pipeline::Enqueue(PipelineBatch batch) {
  const size_t records = batch.batch.size();
  {
    absl::MutexLock lock(&mutex_);
    if (!draining_) {
      batch.enqueued_at = absl::Now();
      queue_.push_back(std::move(batch));
      return;
    }
  }
  stats_.AddShutdownDropped(records);
}

void Pipeline::Shutdown(absl::Time deadline) {
  std::deque<PipelineBatch> leftovers;
  {
    absl::MutexLock lock(&mutex_);
    if (stopping_) {
      return;
    }
    draining_ = true;
    if (!workers_.empty()) {
      mutex_.AwaitWithDeadline(absl::Condition(this, &Pipeline::IsIdle),
                               deadline);
    }
    stopping_ = true;
    leftovers.swap(queue_);
  }
  for (std::thread& worker : workers_) {
    worker.join();
  }
  if (batch_processor_ != nullptr) {
    batch_processor_->Shutdown();
  }
  uint64_t dropped = 0;
  for (const PipelineBatch& batch : leftovers) {
    dropped += batch.batch.size();
  }
  if (dropped > 0) {
    stats_.AddShutdownDropped(dropped);
    LOG(WARNING) << "Pipeline " << name_ << " dropped " << dropped
                 << " queued records at shutdown";
  }
}

absl::optional<absl::Time> Pipeline::OldestQueuedTime() const {
  absl::MutexLock lock(&mutex_);
  if (queue_.empty()) {
    return absl::nullopt;
  }
  return queue_.front().enqueued_at;
}

uint64_t Pipeline::EvictOldest() {
  PipelineBatch evicted;
  {
    absl::MutexLock lock(&mutex_);
    if (queue_.empty()) {
      return 0;
    }
    evicted = std::move(queue_.front());
    queue_.pop_front();
  }
  // The reservation is released here, outside of the queue lock.
  return evicted.batch.size();
}

size_t Pipeline::queue_depth() const {
  absl::MutexLock lock(&mutex_);
  return queue_.size();
}

bool Pipeline::HasWorkOrStopping() const {
  return stopping_ || !queue_.empty();
}

bool Pipeline::IsIdle() const { return queue_.empty() && busy_workers_ == 0; }

void Pipeline::RunWorker() {
  while (true) {
    PipelineBatch batch;
    {
      absl::MutexLock lock(&mutex_);
      mutex_.Await(absl::Condition(this, &Pipeline::HasWorkOrStopping));
      if (stopping_) {
        return;
      }
      batch = std::move(queue_.front());
      queue_.pop_front();
      ++busy_workers_;
    }
    Process(std::move(batch));
    absl::MutexLock lock(&mutex_);
    --busy_workers_;
  }
}

void Pipeline::Process(PipelineBatch batch) {
  if (resource_processor_ != nullptr) {
    batch.batch = resource_processor_->Process(std::move(batch.batch));
  }
  if (batch_processor_ != nullptr) {
    batch_processor_->Add(std::move(batch));
    return;
  }
  fanout_.Dispatch(std::move(batch.batch), std::move(batch.reservations));
}

}  // namespace telemetry_relay
