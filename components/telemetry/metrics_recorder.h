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

#ifndef COMPONENTS_TELEMETRY_METRICS_RECORDER_H_
#define COMPONENTS_TELEMETRY_METRICS_RECORDER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "components/util/duration.h"

namespace telemetry_relay {

// Records the relay's own OpenTelemetry metrics. Without a configured meter
// provider every call is a no-op.
class MetricsRecorder {
 public:
  static std::unique_ptr<MetricsRecorder> Create(std::string service_name,
                                                 std::string build_version);

  virtual ~MetricsRecorder() = default;

  // Counts `count` occurrences of `event` that ended with `status`.
  virtual void IncrementEventStatus(std::string event, absl::Status status,
                                    uint64_t count = 1) = 0;

  // Adds `duration` to the latency histogram of `event`.
  virtual void RecordLatency(std::string event, absl::Duration duration) = 0;
};

// Records the lifetime of the instance as the latency of `event_name`.
class ScopeLatencyRecorder {
 public:
  ScopeLatencyRecorder(std::string event_name,
                       MetricsRecorder& metrics_recorder);
  ~ScopeLatencyRecorder();

  absl::Duration GetLatency() const;

 private:
  Stopwatch stopwatch_;
  std::string event_name_;
  MetricsRecorder& metrics_recorder_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_TELEMETRY_METRICS_RECORDER_H_
