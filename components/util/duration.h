// Copyright 2022 Google LLC
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

#ifndef COMPONENTS_UTIL_DURATION_H_
#define COMPONENTS_UTIL_DURATION_H_

#include <chrono>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace telemetry_relay {

// Point on the monotonic clock. Arithmetic saturates at `Min()`/`Max()`.
class SteadyTime {
 public:
  SteadyTime() : time_(std::chrono::time_point<std::chrono::steady_clock>()) {}

  static SteadyTime Now();
  static SteadyTime Max();
  static SteadyTime Min();

  SteadyTime& operator+=(absl::Duration d);

  friend SteadyTime operator+(const SteadyTime& t, absl::Duration d);
  friend SteadyTime operator-(const SteadyTime& t, absl::Duration d);
  friend absl::Duration operator-(const SteadyTime& t1, const SteadyTime& t2);

  friend bool operator<(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ < t2.time_;
  }
  friend bool operator<=(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ <= t2.time_;
  }
  friend bool operator>(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ > t2.time_;
  }
  friend bool operator>=(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ >= t2.time_;
  }
  friend bool operator==(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ == t2.time_;
  }
  friend bool operator!=(const SteadyTime& t1, const SteadyTime& t2) {
    return t1.time_ != t2.time_;
  }

 private:
  explicit SteadyTime(std::chrono::time_point<std::chrono::steady_clock> time)
      : time_(time) {}

  std::chrono::time_point<std::chrono::steady_clock> time_;
};

// Injectable source of `SteadyTime`. Production code takes
// `SteadyClock::RealClock()`, tests pass a `SimulatedSteadyClock`.
class SteadyClock {
 public:
  // Thread-safe.
  static SteadyClock& RealClock();

  virtual ~SteadyClock() = default;

  virtual SteadyTime Now() = 0;
};

// Clock that only moves through `AdvanceTime`. Thread-safe.
class SimulatedSteadyClock : public SteadyClock {
 public:
  SimulatedSteadyClock() = default;

  SteadyTime Now() override;

  void AdvanceTime(absl::Duration d);

 private:
  absl::Mutex lock_;
  SteadyTime now_ ABSL_GUARDED_BY(lock_);
};

// Measures elapsed time since construction or the last `Reset`.
class Stopwatch {
 public:
  explicit Stopwatch(SteadyClock& clock);
  Stopwatch() : Stopwatch(SteadyClock::RealClock()) {}

  void Reset();

  SteadyTime GetStartTime() const;

  absl::Duration GetElapsedTime() const;

 private:
  SteadyClock& clock_;
  SteadyTime start_time_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_UTIL_DURATION_H_
