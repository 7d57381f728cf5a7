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

#include "components/util/duration.h"

#include <chrono>  // NOLINT

#include "absl/log/log.h"

namespace telemetry_relay {
namespace {

using SteadyDuration = std::chrono::steady_clock::duration;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

constexpr SteadyTimePoint kTimePointMin = SteadyTimePoint::min();
constexpr SteadyTimePoint kTimePointMax = SteadyTimePoint::max();

SteadyDuration ToSteadyDuration(absl::Duration d) {
  return std::chrono::duration_cast<SteadyDuration>(
      absl::ToChronoNanoseconds(d));
}

}  // namespace

SteadyTime SteadyTime::Now() {
  return SteadyTime(std::chrono::steady_clock::now());
}

SteadyTime SteadyTime::Max() { return SteadyTime(kTimePointMax); }

SteadyTime SteadyTime::Min() { return SteadyTime(kTimePointMin); }

SteadyTime& SteadyTime::operator+=(absl::Duration d) {
  *this = *this + d;
  return *this;
}

SteadyTime operator+(const SteadyTime& t, absl::Duration d) {
  if (d == absl::InfiniteDuration()) {
    return SteadyTime::Max();
  }
  if (d == -absl::InfiniteDuration()) {
    return SteadyTime::Min();
  }
  const SteadyDuration step = ToSteadyDuration(d);
  if (step >= SteadyDuration::zero()) {
    if (t.time_ >= kTimePointMax - step) {
      return SteadyTime::Max();
    }
  } else if (t.time_ <= kTimePointMin - step) {
    return SteadyTime::Min();
  }
  return SteadyTime(t.time_ + step);
}

SteadyTime operator-(const SteadyTime& t, absl::Duration d) { return t + -d; }

absl::Duration operator-(const SteadyTime& t1, const SteadyTime& t2) {
  return absl::FromChrono(t1.time_ - t2.time_);
}

namespace {

class RealTimeSteadyClock final : public SteadyClock {
 public:
  SteadyTime Now() override { return SteadyTime::Now(); }
};

}  // namespace

SteadyClock& SteadyClock::RealClock() {
  static RealTimeSteadyClock* const real_clock = new RealTimeSteadyClock();
  return *real_clock;
}

SteadyTime SimulatedSteadyClock::Now() {
  absl::MutexLock l(&lock_);
  return now_;
}

void SimulatedSteadyClock::AdvanceTime(absl::Duration d) {
  if (d < absl::ZeroDuration()) {
    LOG(ERROR) << "Steady clocks are monotonic, ignoring negative advance "
               << d;
    return;
  }
  absl::MutexLock l(&lock_);
  now_ += d;
}

Stopwatch::Stopwatch(SteadyClock& clock)
    : clock_(clock), start_time_(clock_.Now()) {}

void Stopwatch::Reset() { start_time_ = clock_.Now(); }

SteadyTime Stopwatch::GetStartTime() const { return start_time_; }

absl::Duration Stopwatch::GetElapsedTime() const {
  return clock_.Now() - start_time_;
}

}  // namespace telemetry_relay
