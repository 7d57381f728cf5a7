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

#ifndef PUBLIC_TEST_UTIL_TELEMETRY_RECORD_H_
#define PUBLIC_TEST_UTIL_TELEMETRY_RECORD_H_

#include <string>
#include <utility>
#include <vector>

#include "public/telemetry/v1/telemetry.pb.h"

namespace telemetry_relay {

inline v1::Record GetSpanRecord(std::string service_name = "checkout",
                                std::string name = "GET /cart",
                                std::string span_id = "00f067aa0ba902b7") {
  v1::Record record;
  v1::Span* span = record.mutable_span();
  span->set_trace_id("4bf92f3577b34da6a3ce929d0e0e4736");
  span->set_span_id(std::move(span_id));
  span->set_service_name(std::move(service_name));
  span->set_name(std::move(name));
  span->set_kind(v1::Span::KIND_SERVER);
  span->set_start_time_unix_nano(1700000000000000000);
  span->set_end_time_unix_nano(1700000000250000000);
  span->mutable_status()->set_code(v1::SpanStatus::CODE_OK);
  return record;
}

inline v1::Record GetCounterRecord(
    std::string name = "orders_total", double value = 1,
    std::vector<std::pair<std::string, std::string>> labels = {}) {
  v1::Record record;
  v1::MetricPoint* metric = record.mutable_metric();
  metric->set_name(std::move(name));
  metric->set_kind(v1::MetricPoint::KIND_COUNTER);
  metric->set_value(value);
  metric->set_time_unix_nano(1700000000000000000);
  for (auto& [key, label_value] : labels) {
    (*metric->mutable_labels())[key] = std::move(label_value);
  }
  return record;
}

inline v1::Record GetGaugeRecord(std::string name = "queue_depth",
                                 double value = 7) {
  v1::Record record = GetCounterRecord(std::move(name), value);
  record.mutable_metric()->set_kind(v1::MetricPoint::KIND_GAUGE);
  return record;
}

// Bounds {0.1, 0.5}, three buckets.
inline v1::Record GetHistogramRecord(std::string name = "request_seconds") {
  v1::Record record;
  v1::MetricPoint* metric = record.mutable_metric();
  metric->set_name(std::move(name));
  metric->set_kind(v1::MetricPoint::KIND_HISTOGRAM);
  v1::Histogram* histogram = metric->mutable_histogram();
  histogram->add_explicit_bounds(0.1);
  histogram->add_explicit_bounds(0.5);
  histogram->add_bucket_counts(2);
  histogram->add_bucket_counts(1);
  histogram->add_bucket_counts(1);
  histogram->set_sum(1.5);
  histogram->set_count(4);
  return record;
}

inline v1::ExportRequest GetExportRequest(std::vector<v1::Record> records) {
  v1::ExportRequest request;
  for (v1::Record& record : records) {
    *request.add_records() = std::move(record);
  }
  return request;
}

}  // namespace telemetry_relay

#endif  // PUBLIC_TEST_UTIL_TELEMETRY_RECORD_H_
