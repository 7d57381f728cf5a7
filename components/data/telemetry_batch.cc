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

#include "components/data/telemetry_batch.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kEmptyRecord = 1,
  kInvalidTraceId = 2,
  kInvalidSpanId = 3,
  kInvalidParentSpanId = 4,
  kEndBeforeStart = 5,
  kMissingMetricName = 6,
  kMissingMetricKind = 7,
  kInvalidHistogram = 8,
};

constexpr size_t kTraceIdHexLength = 32;
constexpr size_t kSpanIdHexLength = 16;

absl::Status InvalidRecord(ErrorTag tag, absl::string_view message) {
  return StatusWithErrorTag(absl::InvalidArgumentError(message), __FILE__,
                            tag);
}

// Lowercase or uppercase hex of exactly `length` characters, not all zero.
bool IsHexId(absl::string_view id, size_t length) {
  if (id.size() != length) {
    return false;
  }
  bool non_zero = false;
  for (char c : id) {
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    non_zero |= c != '0';
  }
  return non_zero;
}

absl::Status ValidateSpan(const v1::Span& span) {
  if (!IsHexId(span.trace_id(), kTraceIdHexLength)) {
    return InvalidRecord(ErrorTag::kInvalidTraceId,
                         absl::StrCat("invalid trace id '", span.trace_id(),
                                      "', want 32 hex characters"));
  }
  if (!IsHexId(span.span_id(), kSpanIdHexLength)) {
    return InvalidRecord(ErrorTag::kInvalidSpanId,
                         absl::StrCat("invalid span id '", span.span_id(),
                                      "', want 16 hex characters"));
  }
  if (!span.parent_span_id().empty() &&
      !IsHexId(span.parent_span_id(), kSpanIdHexLength)) {
    return InvalidRecord(ErrorTag::kInvalidParentSpanId,
                         absl::StrCat("invalid parent span id '",
                                      span.parent_span_id(), "'"));
  }
  if (span.end_time_unix_nano() < span.start_time_unix_nano()) {
    return InvalidRecord(
        ErrorTag::kEndBeforeStart,
        absl::StrCat("span ", span.span_id(), " ends before it starts"));
  }
  return absl::OkStatus();
}

absl::Status ValidateMetric(const v1::MetricPoint& metric) {
  if (metric.name().empty()) {
    return InvalidRecord(ErrorTag::kMissingMetricName,
                         "metric point without a name");
  }
  if (metric.kind() == v1::MetricPoint::KIND_UNSPECIFIED) {
    return InvalidRecord(ErrorTag::kMissingMetricKind,
                         absl::StrCat("metric ", metric.name(),
                                      " has no kind"));
  }
  if (metric.kind() != v1::MetricPoint::KIND_HISTOGRAM) {
    return absl::OkStatus();
  }
  const v1::Histogram& histogram = metric.histogram();
  if (histogram.bucket_counts_size() != histogram.explicit_bounds_size() + 1) {
    return InvalidRecord(
        ErrorTag::kInvalidHistogram,
        absl::StrCat("histogram ", metric.name(), " has ",
                     histogram.bucket_counts_size(), " buckets for ",
                     histogram.explicit_bounds_size(), " bounds"));
  }
  for (int i = 1; i < histogram.explicit_bounds_size(); ++i) {
    if (!(histogram.explicit_bounds(i - 1) < histogram.explicit_bounds(i))) {
      return InvalidRecord(ErrorTag::kInvalidHistogram,
                           absl::StrCat("histogram ", metric.name(),
                                        " bounds are not increasing"));
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::string_view SignalName(Signal signal) {
  switch (signal) {
    case Signal::kTraces:
      return "traces";
    case Signal::kMetrics:
      return "metrics";
  }
  return "unknown";
}

std::string AttributeValueToString(const v1::AttributeValue& value) {
  switch (value.value_case()) {
    case v1::AttributeValue::kStringValue:
      return value.string_value();
    case v1::AttributeValue::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case v1::AttributeValue::kIntValue:
      return absl::StrCat(value.int_value());
    case v1::AttributeValue::kDoubleValue:
      return absl::StrCat(value.double_value());
    case v1::AttributeValue::VALUE_NOT_SET:
      break;
  }
  return "";
}

Signal SignalOf(const v1::Record& record) {
  return record.has_metric() ? Signal::kMetrics : Signal::kTraces;
}

absl::Status ValidateRecord(const v1::Record& record) {
  switch (record.record_case()) {
    case v1::Record::kSpan:
      return ValidateSpan(record.span());
    case v1::Record::kMetric:
      return ValidateMetric(record.metric());
    case v1::Record::RECORD_NOT_SET:
      break;
  }
  return InvalidRecord(ErrorTag::kEmptyRecord,
                       "record holds neither a span nor a metric point");
}

TelemetryBatch::TelemetryBatch(std::vector<v1::Record> records)
    : records_(std::move(records)) {
  for (const v1::Record& record : records_) {
    byte_size_ += record.ByteSizeLong();
  }
}

absl::StatusOr<TelemetryBatch> TelemetryBatch::FromRequest(
    v1::ExportRequest request) {
  std::vector<v1::Record> records;
  records.reserve(request.records_size());
  for (int i = 0; i < request.records_size(); ++i) {
    if (absl::Status status = ValidateRecord(request.records(i));
        !status.ok()) {
      absl::Status annotated(
          status.code(), absl::StrCat("record ", i, ": ", status.message()));
      status.ForEachPayload(
          [&annotated](absl::string_view key, const absl::Cord& payload) {
            annotated.SetPayload(key, payload);
          });
      return annotated;
    }
  }
  for (v1::Record& record : *request.mutable_records()) {
    records.push_back(std::move(record));
  }
  return TelemetryBatch(std::move(records));
}

size_t TelemetryBatch::CountSignal(Signal signal) const {
  size_t count = 0;
  for (const v1::Record& record : records_) {
    count += SignalOf(record) == signal ? 1 : 0;
  }
  return count;
}

TelemetryBatch TelemetryBatch::FilterSignal(Signal signal) const {
  std::vector<v1::Record> records;
  for (const v1::Record& record : records_) {
    if (SignalOf(record) == signal) {
      records.push_back(record);
    }
  }
  return TelemetryBatch(std::move(records));
}

v1::ExportRequest TelemetryBatch::ToRequest() const {
  v1::ExportRequest request;
  request.mutable_records()->Reserve(static_cast<int>(records_.size()));
  for (const v1::Record& record : records_) {
    *request.add_records() = record;
  }
  return request;
}

std::vector<v1::Record> TelemetryBatch::ReleaseRecords() && {
  std::vector<v1::Record> records;
  records.swap(records_);
  byte_size_ = 0;
  return records;
}

}  // namespace telemetry_relay
