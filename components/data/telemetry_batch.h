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

#ifndef COMPONENTS_DATA_TELEMETRY_BATCH_H_
#define COMPONENTS_DATA_TELEMETRY_BATCH_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "public/telemetry/v1/telemetry.pb.h"

namespace telemetry_relay {

enum class Signal { kTraces, kMetrics };

absl::string_view SignalName(Signal signal);

// Signal of a record holding a span or a metric point. Records holding
// neither are rejected by `ValidateRecord`.
Signal SignalOf(const v1::Record& record);

// Text rendering of an attribute: strings as is, `true`/`false`, decimal
// numbers.
std::string AttributeValueToString(const v1::AttributeValue& value);

// Checks one record: exactly one of span/metric, well formed ids, ordered
// timestamps, named metrics and consistent histograms.
absl::Status ValidateRecord(const v1::Record& record);

// Ordered records received together. Instances are never mutated once handed
// to a pipeline; exporters share them through `TelemetryBatchPtr`.
class TelemetryBatch {
 public:
  TelemetryBatch() = default;
  // `records` must already be valid.
  explicit TelemetryBatch(std::vector<v1::Record> records);

  TelemetryBatch(TelemetryBatch&&) = default;
  TelemetryBatch& operator=(TelemetryBatch&&) = default;
  TelemetryBatch(const TelemetryBatch&) = default;
  TelemetryBatch& operator=(const TelemetryBatch&) = default;

  // Validates every record of `request`. A single invalid record rejects the
  // whole request with INVALID_ARGUMENT.
  static absl::StatusOr<TelemetryBatch> FromRequest(v1::ExportRequest request);

  const std::vector<v1::Record>& records() const { return records_; }
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  // Serialized size of the records, used for memory accounting.
  uint64_t ByteSize() const { return byte_size_; }

  size_t CountSignal(Signal signal) const;

  // Records of `signal`, in their original order.
  TelemetryBatch FilterSignal(Signal signal) const;

  v1::ExportRequest ToRequest() const;

  // Moves the records out, leaving this batch empty.
  std::vector<v1::Record> ReleaseRecords() &&;

 private:
  std::vector<v1::Record> records_;
  uint64_t byte_size_ = 0;
};

using TelemetryBatchPtr = std::shared_ptr<const TelemetryBatch>;

}  // namespace telemetry_relay

#endif  // COMPONENTS_DATA_TELEMETRY_BATCH_H_
