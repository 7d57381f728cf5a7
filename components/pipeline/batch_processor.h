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

#ifndef COMPONENTS_PIPELINE_BATCH_PROCESSOR_H_
#define COMPONENTS_PIPELINE_BATCH_PROCESSOR_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "components/pipeline/pipeline_batch.h"
#include "public/config/v1/pipeline_config.pb.h"

namespace telemetry_relay {

// Accumulates records of consecutive batches and releases them downstream
// once `send_batch_size` records are pending or `timeout_ms` elapsed since
// the first pending record arrived, whichever comes first. Released batches
// hold at most `send_batch_max_size` records. Records keep their arrival
// order and the records of one input batch stay contiguous.
//
// `output` is called with the processor lock held so that released batches
// are delivered in order; it must not block.
class BatchProcessor {
 public:
  using SettingsProvider = std::function<config::v1::BatchConfig()>;
  using Output = std::function<void(PipelineBatch)>;

  BatchProcessor(std::string name, SettingsProvider settings, Output output);
  ~BatchProcessor();

  BatchProcessor(const BatchProcessor&) = delete;
  BatchProcessor& operator=(const BatchProcessor&) = delete;

  // Starts the flush timer.
  void Start();

  void Add(PipelineBatch batch);

  // Releases every pending record now.
  void Flush();

  // Stops the timer and releases pending records. Idempotent.
  void Shutdown();

  size_t pending_records() const;

 private:
  struct Segment {
    std::vector<v1::Record> records;
    std::vector<ReservationPtr> reservations;
  };

  void RunTimer();
  bool HasWorkOrStopping() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Releases the first `count` pending records as one batch.
  void ReleaseLocked(size_t count) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void ReleaseAllLocked(size_t max_size) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const std::string name_;
  const SettingsProvider settings_;
  const Output output_;

  mutable absl::Mutex mutex_;
  std::deque<Segment> pending_ ABSL_GUARDED_BY(mutex_);
  size_t pending_count_ ABSL_GUARDED_BY(mutex_) = 0;
  absl::Time deadline_ ABSL_GUARDED_BY(mutex_) = absl::InfiniteFuture();
  bool stopping_ ABSL_GUARDED_BY(mutex_) = false;
  std::thread timer_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_BATCH_PROCESSOR_H_
