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

#ifndef COMPONENTS_PIPELINE_MEMORY_LIMITER_H_
#define COMPONENTS_PIPELINE_MEMORY_LIMITER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "components/pipeline/relay_stats.h"

namespace telemetry_relay {

enum class LimiterState { kNormal, kSoftLimited, kHardLimited };

absl::string_view LimiterStateName(LimiterState state);

struct MemoryLimits {
  uint64_t soft_bytes = 0;
  uint64_t hard_bytes = 0;
};

// Queue holding admitted batches that have not been processed yet. The
// limiter evicts from it when it needs room below the hard limit.
class EvictableQueue {
 public:
  virtual ~EvictableQueue() = default;

  // Enqueue time of the oldest queued batch, if any.
  virtual absl::optional<absl::Time> OldestQueuedTime() const = 0;

  // Drops the oldest queued batch and returns its record count, 0 when the
  // queue is empty. Must not be called with any limiter lock held, since
  // dropping the batch releases its reservation.
  virtual uint64_t EvictOldest() = 0;
};

class MemoryLimiter;

// Bytes held on behalf of an admitted batch. Released on destruction, which
// happens once every batch derived from the admitted one reached a terminal
// result at every exporter.
class MemoryReservation {
 public:
  ~MemoryReservation();
  MemoryReservation(const MemoryReservation&) = delete;
  MemoryReservation& operator=(const MemoryReservation&) = delete;

  uint64_t bytes() const { return bytes_; }

 private:
  friend class MemoryLimiter;
  MemoryReservation(MemoryLimiter& limiter, uint64_t bytes)
      : limiter_(limiter), bytes_(bytes) {}

  MemoryLimiter& limiter_;
  const uint64_t bytes_;
};

using ReservationPtr = std::shared_ptr<const MemoryReservation>;

// Approximate accounting of in-flight telemetry bytes, shared by every
// pipeline that lists the same memory limiter processor.
//
// Admission refuses new batches while usage is above the soft limit. When a
// batch would take usage above the hard limit the oldest queued batches of
// the registered queues are evicted until it fits; if it still does not, it
// is refused and the limiter reports `kHardLimited` until usage is back
// under the soft limit. Accounted usage never exceeds the hard limit.
class MemoryLimiter {
 public:
  using LimitsProvider = std::function<MemoryLimits()>;

  // `limits` is consulted on every admission so that reloads apply to the
  // next batch.
  MemoryLimiter(std::string name, LimitsProvider limits, RelayStats& stats);
  MemoryLimiter(const MemoryLimiter&) = delete;
  MemoryLimiter& operator=(const MemoryLimiter&) = delete;

  // Reserves `bytes` for a batch of `records` records. Returns
  // RESOURCE_EXHAUSTED when the batch must be refused.
  absl::StatusOr<ReservationPtr> Reserve(uint64_t bytes, uint64_t records);

  void RegisterQueue(EvictableQueue* queue);
  void UnregisterQueue(EvictableQueue* queue);

  const std::string& name() const { return name_; }
  uint64_t usage_bytes() const;
  // Highest usage seen since creation.
  uint64_t peak_usage_bytes() const;
  LimiterState state() const;
  MemoryLimits limits() const { return limits_(); }

 private:
  friend class MemoryReservation;

  void Release(uint64_t bytes);
  // Admits under `mutex_` if `bytes` fits below the hard limit.
  bool TryAdmitLocked(uint64_t bytes, const MemoryLimits& limits)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void UpdateStateLocked(const MemoryLimits& limits)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Evicts the oldest batch across the registered queues. Returns false when
  // every queue is empty.
  bool EvictOldestQueued();

  const std::string name_;
  const LimitsProvider limits_;
  RelayStats& stats_;

  mutable absl::Mutex mutex_;
  uint64_t usage_ ABSL_GUARDED_BY(mutex_) = 0;
  uint64_t peak_usage_ ABSL_GUARDED_BY(mutex_) = 0;
  LimiterState state_ ABSL_GUARDED_BY(mutex_) = LimiterState::kNormal;

  mutable absl::Mutex queues_mutex_;
  std::vector<EvictableQueue*> queues_ ABSL_GUARDED_BY(queues_mutex_);
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_MEMORY_LIMITER_H_
