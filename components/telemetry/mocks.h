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

#ifndef COMPONENTS_TELEMETRY_MOCKS_H_
#define COMPONENTS_TELEMETRY_MOCKS_H_

#include <string>

#include "components/telemetry/metrics_recorder.h"
#include "gmock/gmock.h"

namespace telemetry_relay {

class MockMetricsRecorder : public MetricsRecorder {
 public:
  MOCK_METHOD(void, IncrementEventStatus,
              (std::string event, absl::Status status, uint64_t count),
              (override));
  MOCK_METHOD(void, RecordLatency, (std::string event, absl::Duration duration),
              (override));
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_TELEMETRY_MOCKS_H_
