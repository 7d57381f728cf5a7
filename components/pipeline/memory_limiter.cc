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

#include "components/pipeline/memory_limiter.h"

#include <algorithm>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kAboveSoftLimit = 1,
  kAtHardLimit = 2,
  kLargerThanHardLimit = 3,
};

}  // namespace

absl::string_view LimiterStateName(LimiterState state) {
  switch (state) {
    case LimiterState::kNormal:
      return "normal";
    case LimiterState::kSoftLimited:
      return "soft_limited";
    case LimiterState::kHardLimited:
      return "hard_limited";
  }
  return "unknown";
}

MemoryReservation::~MemoryReservation() { limiter_.Release(bytes_); }

MemoryLimiter::MemoryLimiter(std::string name, LimitsProvider limits,
                             RelayStats& stats)
    : name_(std::move(name)), limits_(std::move(limits)), stats_(stats) {}

absl::StatusOr<ReservationPtr> MemoryLimiter::Reserve(uint64_t bytes,
                                                      uint64_t records) {
  const MemoryLimits limits = limits_();
  if (bytes > limits.hard_bytes) {
    // Cannot fit even in an empty limiter.
    stats_.AddRefused(records);
    return StatusWithErrorTag(
        absl::InvalidArgumentError(absl::StrCat(
            "batch of ", bytes, " bytes exceeds the hard limit of memory "
            "limiter ", name_, " (", limits.hard_bytes, " bytes)")),
        __FILE__, ErrorTag::kLargerThanHardLimit);
  }
  {
    absl::MutexLock lock(&mutex_);
    if (usage_ > limits.soft_bytes) {
      UpdateStateLocked(limits);
      stats_.AddRefused(records);
      return StatusWithErrorTag(
          absl::ResourceExhaustedError(absl::StrCat(
              "memory limiter ", name_, " is above its soft limit")),
          __FILE__, ErrorTag::kAboveSoftLimit);
    }
    if (TryAdmitLocked(bytes, limits)) {
      return ReservationPtr(new MemoryReservation(*this, bytes));
    }
  }
  // Garbage pass: make room by dropping the oldest queued batches.
  while (EvictOldestQueued()) {
    absl::MutexLock lock(&mutex_);
    if (TryAdmitLocked(bytes, limits)) {
      return ReservationPtr(new MemoryReservation(*this, bytes));
    }
  }
  absl::MutexLock lock(&mutex_);
  // `bytes` fits under the hard limit on its own, so `usage_` is held by
  // reservations whose release leaves this state.
  state_ = LimiterState::kHardLimited;
  stats_.AddRefused(records);
  LOG_EVERY_N_SEC(WARNING, 10)
      << "Memory limiter " << name_ << " refused a batch of " << bytes
      << " bytes at usage " << usage_ << " of hard limit " << limits.hard_bytes;
  return StatusWithErrorTag(
      absl::ResourceExhaustedError(
          absl::StrCat("memory limiter ", name_, " is at its hard limit")),
      __FILE__, ErrorTag::kAtHardLimit);
}

bool MemoryLimiter::TryAdmitLocked(uint64_t bytes, const MemoryLimits& limits) {
  if (usage_ + bytes > limits.hard_bytes) {
    return false;
  }
  usage_ += bytes;
  peak_usage_ = std::max(peak_usage_, usage_);
  UpdateStateLocked(limits);
  return true;
}

void MemoryLimiter::UpdateStateLocked(const MemoryLimits& limits) {
  if (usage_ <= limits.soft_bytes) {
    state_ = LimiterState::kNormal;
  } else if (state_ == LimiterState::kNormal) {
    state_ = LimiterState::kSoftLimited;
  }
}

void MemoryLimiter::Release(uint64_t bytes) {
  const MemoryLimits limits = limits_();
  absl::MutexLock lock(&mutex_);
  usage_ -= std::min(usage_, bytes);
  UpdateStateLocked(limits);
}

bool MemoryLimiter::EvictOldestQueued() {
  absl::MutexLock lock(&queues_mutex_);
  EvictableQueue* oldest_queue = nullptr;
  absl::Time oldest = absl::InfiniteFuture();
  for (EvictableQueue* queue : queues_) {
    absl::optional<absl::Time> queued = queue->OldestQueuedTime();
    if (queued.has_value() && *queued < oldest) {
      oldest = *queued;
      oldest_queue = queue;
    }
  }
  if (oldest_queue == nullptr) {
    return false;
  }
  const uint64_t records = oldest_queue->EvictOldest();
  stats_.AddEvicted(records);
  VLOG(1) << "Memory limiter " << name_ << " evicted " << records
          << " queued records";
  return true;
}

void MemoryLimiter::RegisterQueue(EvictableQueue* queue) {
  absl::MutexLock lock(&queues_mutex_);
  queues_.push_back(queue);
}

void MemoryLimiter::UnregisterQueue(EvictableQueue* queue) {
  absl::MutexLock lock(&queues_mutex_);
  queues_.erase(std::remove(queues_.begin(), queues_.end(), queue),
                queues_.end());
}

uint64_t MemoryLimiter::usage_bytes() const {
  absl::MutexLock lock(&mutex_);
  return usage_;
}

uint64_t MemoryLimiter::peak_usage_bytes() const {
  absl::MutexLock lock(&mutex_);
  return peak_usage_;
}

LimiterState MemoryLimiter::state() const {
  absl::MutexLock lock(&mutex_);
  return state_;
}

}  // namespace telemetry_relay
