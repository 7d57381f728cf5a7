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

#ifndef COMPONENTS_PIPELINE_PIPELINE_H_
#define COMPONENTS_PIPELINE_PIPELINE_H_

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "components/exporters/fanout.h"
#include "components/pipeline/batch_processor.h"
#include "components/pipeline/memory_limiter.h"
#include "components/pipeline/pipeline_batch.h"
#include "components/pipeline/relay_stats.h"
#include "components/pipeline/resource_processor.h"

namespace telemetry_relay {

// Processor stages of one pipeline. A missing stage is skipped.
struct PipelineStages {
  // Shared with other pipelines listing the same processor; not owned.
  MemoryLimiter* memory_limiter = nullptr;
  ResourceProcessor::SettingsProvider resource;
  BatchProcessor::SettingsProvider batch;
};

// One signal path from receivers to exporters: admission through the memory
// limiter, an input queue drained by a pool of workers, the resource and
// batch processors, and the fan-out to every exporter of the pipeline.
class Pipeline : public EvictableQueue {
 public:
  Pipeline(std::string name, Signal signal, PipelineStages stages,
           Fanout fanout, size_t num_workers, RelayStats& stats);
  ~Pipeline() override;

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void Start();

  // Reserves memory for `batch`, which must only hold records of `signal()`.
  // Returns RESOURCE_EXHAUSTED when the memory limiter refuses it. Nothing
  // is queued until `Enqueue`.
  absl::StatusOr<PipelineBatch> Admit(TelemetryBatch batch);

  // Queues an admitted batch for the workers. Batches arriving after
  // `Shutdown` started are dropped and counted.
  void Enqueue(PipelineBatch batch);

  // Lets the workers drain the queue until `deadline`, flushes the batch
  // processor and drops whatever is still queued. Exporters are shut down by
  // their owner.
  void Shutdown(absl::Time deadline);

  absl::optional<absl::Time> OldestQueuedTime() const override;
  uint64_t EvictOldest() override;

  const std::string& name() const { return name_; }
  Signal signal() const { return signal_; }
  size_t queue_depth() const;

 private:
  void RunWorker();
  void Process(PipelineBatch batch);
  bool HasWorkOrStopping() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  bool IsIdle() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const std::string name_;
  const Signal signal_;
  MemoryLimiter* const memory_limiter_;
  std::unique_ptr<ResourceProcessor> resource_processor_;
  const Fanout fanout_;
  std::unique_ptr<BatchProcessor> batch_processor_;
  const size_t num_workers_;
  RelayStats& stats_;

  mutable absl::Mutex mutex_;
  std::deque<PipelineBatch> queue_ ABSL_GUARDED_BY(mutex_);
  size_t busy_workers_ ABSL_GUARDED_BY(mutex_) = 0;
  bool draining_ ABSL_GUARDED_BY(mutex_) = false;
  bool stopping_ ABSL_GUARDED_BY(mutex_) = false;
  std::vector<std::thread> workers_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_PIPELINE_H_
