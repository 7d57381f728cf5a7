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

#include "components/pipeline/batch_processor.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "absl/log/log.h"

namespace telemetry_relay {

BatchProcessor::BatchProcessor(std::string name, SettingsProvider settings,
                               Output output)
    : name_(std::move(name)),
      settings_(std::move(settings)),
      output_(std::move(output)) {}

BatchProcessor::~BatchProcessor() { Shutdown(); }

void BatchProcessor::Start() {
  timer_ = std::thread([this] { RunTimer(); });
}

void BatchProcessor::Add(PipelineBatch batch) {
  if (batch.batch.empty()) {
    return;
  }
  const config::v1::BatchConfig settings = settings_();
  absl::MutexLock lock(&mutex_);
  if (pending_count_ == 0) {
    deadline_ = absl::Now() + absl::Milliseconds(settings.timeout_ms());
  }
  Segment segment;
  segment.records = std::move(batch.batch).ReleaseRecords();
  segment.reservations = std::move(batch.reservations);
  pending_count_ += segment.records.size();
  pending_.push_back(std::move(segment));

  const size_t max_size = settings.send_batch_max_size();
  if (settings.timeout_ms() == 0 || stopping_) {
    ReleaseAllLocked(max_size);
    return;
  }
  const size_t trigger = settings.send_batch_size();
  if (trigger > 0 && pending_count_ >= trigger) {
    while (pending_count_ >= trigger) {
      ReleaseLocked(max_size == 0 ? pending_count_
                                  : std::min(pending_count_, max_size));
    }
    deadline_ = absl::Now() + absl::Milliseconds(settings.timeout_ms());
  } else if (max_size > 0) {
    while (pending_count_ >= max_size) {
      ReleaseLocked(max_size);
    }
  }
}

void BatchProcessor::Flush() {
  const config::v1::BatchConfig settings = settings_();
  absl::MutexLock lock(&mutex_);
  ReleaseAllLocked(settings.send_batch_max_size());
}

void BatchProcessor::Shutdown() {
  {
    absl::MutexLock lock(&mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  if (timer_.joinable()) {
    timer_.join();
  }
  Flush();
}

size_t BatchProcessor::pending_records() const {
  absl::MutexLock lock(&mutex_);
  return pending_count_;
}

void BatchProcessor::RunTimer() {
  VLOG(1) << "Batch processor " << name_ << " timer started";
  absl::MutexLock lock(&mutex_);
  while (!stopping_) {
    if (pending_count_ == 0) {
      mutex_.Await(
          absl::Condition(this, &BatchProcessor::HasWorkOrStopping));
      continue;
    }
    mutex_.AwaitWithDeadline(absl::Condition(&stopping_), deadline_);
    if (!stopping_ && pending_count_ > 0 && absl::Now() >= deadline_) {
      ReleaseAllLocked(settings_().send_batch_max_size());
    }
  }
  VLOG(1) << "Batch processor " << name_ << " timer stopped";
}

bool BatchProcessor::HasWorkOrStopping() const {
  return stopping_ || pending_count_ > 0;
}

void BatchProcessor::ReleaseAllLocked(size_t max_size) {
  while (pending_count_ > 0) {
    ReleaseLocked(max_size == 0 ? pending_count_
                                : std::min(pending_count_, max_size));
  }
  deadline_ = absl::InfiniteFuture();
}

void BatchProcessor::ReleaseLocked(size_t count) {
  std::vector<v1::Record> records;
  records.reserve(count);
  PipelineBatch out;
  while (count > 0 && !pending_.empty()) {
    Segment& front = pending_.front();
    out.reservations.insert(out.reservations.end(), front.reservations.begin(),
                            front.reservations.end());
    if (front.records.size() <= count) {
      count -= front.records.size();
      pending_count_ -= front.records.size();
      std::move(front.records.begin(), front.records.end(),
                std::back_inserter(records));
      pending_.pop_front();
      continue;
    }
    auto split = front.records.begin() + count;
    std::move(front.records.begin(), split, std::back_inserter(records));
    front.records.erase(front.records.begin(), split);
    pending_count_ -= count;
    count = 0;
  }
  out.batch = TelemetryBatch(std::move(records));
  out.enqueued_at = absl::Now();
  output_(std::move(out));
}

}  // namespace telemetry_relay
