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

#include "components/exporters/metric_store.h"

#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "prometheus/text_serializer.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using testing::HasSubstr;
using testing::Not;

const absl::Time kNow = absl::FromUnixSeconds(1700000000);

TelemetryBatch BatchOf(std::vector<v1::Record> records) {
  return TelemetryBatch(std::move(records));
}

std::string Render(const MetricStore& store) {
  return prometheus::TextSerializer().Serialize(store.Collect());
}

v1::Record Delta(v1::Record record) {
  record.mutable_metric()->set_temporality(
      v1::MetricPoint::TEMPORALITY_DELTA);
  return record;
}

TEST(MetricStoreTest, ExposesCounter) {
  MetricStore store;
  store.Update(BatchOf({GetCounterRecord("orders_total", 1)}),
               /*resource_labels=*/false, kNow);

  EXPECT_EQ(Render(store),
            "# TYPE orders_total counter\n"
            "orders_total 1\n");
}

TEST(MetricStoreTest, CountersGetTotalSuffix) {
  MetricStore store;
  store.Update(BatchOf({GetCounterRecord("http.requests", 3)}), false, kNow);

  EXPECT_THAT(Render(store), HasSubstr("http_requests_total 3\n"));
}

TEST(MetricStoreTest, CumulativeReplacesAndDeltaAdds) {
  MetricStore store;
  store.Update(BatchOf({GetCounterRecord("cumulative_total", 5),
                        GetCounterRecord("cumulative_total", 7),
                        Delta(GetCounterRecord("delta_total", 5)),
                        Delta(GetCounterRecord("delta_total", 7))}),
               false, kNow);

  const std::string text = Render(store);
  EXPECT_THAT(text, HasSubstr("cumulative_total 7\n"));
  EXPECT_THAT(text, HasSubstr("delta_total 12\n"));
}

TEST(MetricStoreTest, GaugeReplaces) {
  MetricStore store;
  store.Update(BatchOf({GetGaugeRecord("queue_depth", 7),
                        Delta(GetGaugeRecord("queue_depth", 3))}),
               false, kNow);

  EXPECT_EQ(Render(store),
            "# TYPE queue_depth gauge\n"
            "queue_depth 3\n");
}

TEST(MetricStoreTest, SeriesAreKeyedByLabels) {
  MetricStore store;
  store.Update(
      BatchOf({GetCounterRecord("orders_total", 1, {{"region", "us"}}),
               GetCounterRecord("orders_total", 2, {{"region", "eu"}})}),
      false, kNow);

  EXPECT_EQ(store.series_count(), 2);
  EXPECT_EQ(Render(store),
            "# TYPE orders_total counter\n"
            "orders_total{region=\"eu\"} 2\n"
            "orders_total{region=\"us\"} 1\n");
}

TEST(MetricStoreTest, ExposesHistogram) {
  MetricStore store;
  v1::Record record = GetHistogramRecord("request_seconds");
  record.mutable_metric()->set_description("Request latency");
  (*record.mutable_metric()->mutable_labels())["route"] = "/cart";
  store.Update(BatchOf({record}), false, kNow);

  EXPECT_EQ(Render(store),
            "# HELP request_seconds Request latency\n"
            "# TYPE request_seconds histogram\n"
            "request_seconds_count{route=\"/cart\"} 4\n"
            "request_seconds_sum{route=\"/cart\"} 1.5\n"
            "request_seconds_bucket{route=\"/cart\",le=\"0.1\"} 2\n"
            "request_seconds_bucket{route=\"/cart\",le=\"0.5\"} 3\n"
            "request_seconds_bucket{route=\"/cart\",le=\"+Inf\"} 4\n");
}

TEST(MetricStoreTest, DeltaHistogramAccumulates) {
  MetricStore store;
  store.Update(BatchOf({Delta(GetHistogramRecord()),
                        Delta(GetHistogramRecord())}),
               false, kNow);

  const std::string text = Render(store);
  EXPECT_THAT(text, HasSubstr("request_seconds_bucket{le=\"+Inf\"} 8\n"));
  EXPECT_THAT(text, HasSubstr("request_seconds_sum 3\n"));
}

TEST(MetricStoreTest, ResourceAttributesBecomeLabelsWhenEnabled) {
  v1::Record record = GetCounterRecord("orders_total", 1, {{"env", "point"}});
  (*record.mutable_resource())["environment"].set_string_value("staging");
  (*record.mutable_resource())["env"].set_string_value("resource");

  MetricStore without;
  without.Update(BatchOf({record}), /*resource_labels=*/false, kNow);
  EXPECT_THAT(Render(without), Not(HasSubstr("staging")));

  MetricStore with;
  with.Update(BatchOf({record}), /*resource_labels=*/true, kNow);
  EXPECT_THAT(Render(with),
              HasSubstr("orders_total{env=\"point\",environment=\"staging\"} "
                        "1\n"));
}

TEST(MetricStoreTest, KindConflictKeepsFirstFamily) {
  MetricStore store;
  store.Update(BatchOf({GetGaugeRecord("temperature", 21),
                        GetHistogramRecord("temperature")}),
               false, kNow);

  EXPECT_EQ(Render(store),
            "# TYPE temperature gauge\n"
            "temperature 21\n");
}

TEST(MetricStoreTest, ExpiresStaleSeries) {
  MetricStore store;
  store.Update(BatchOf({GetGaugeRecord("stale", 1)}), false, kNow);
  store.Update(BatchOf({GetGaugeRecord("fresh", 1)}), false,
               kNow + absl::Minutes(4));

  EXPECT_EQ(store.Expire(kNow + absl::Minutes(6), absl::Minutes(5)), 1);

  const std::string text = Render(store);
  EXPECT_THAT(text, Not(HasSubstr("stale")));
  EXPECT_THAT(text, HasSubstr("fresh 1\n"));
}

TEST(MetricStoreTest, CollectsTypedFamilies) {
  MetricStore store;
  store.Update(BatchOf({GetCounterRecord("b.requests", 2, {{"a.b", "x"}}),
                        GetGaugeRecord("a_depth", 4)}),
               false, kNow);

  const std::vector<prometheus::MetricFamily> families = store.Collect();
  ASSERT_EQ(families.size(), 2);
  EXPECT_EQ(families[0].name, "a_depth");
  EXPECT_EQ(families[0].type, prometheus::MetricType::Gauge);
  EXPECT_EQ(families[0].metric[0].gauge.value, 4);
  EXPECT_EQ(families[1].name, "b_requests_total");
  EXPECT_EQ(families[1].type, prometheus::MetricType::Counter);
  ASSERT_EQ(families[1].metric[0].label.size(), 1);
  EXPECT_EQ(families[1].metric[0].label[0].name, "a_b");
  EXPECT_EQ(families[1].metric[0].label[0].value, "x");
  EXPECT_EQ(families[1].metric[0].counter.value, 2);
}

TEST(MetricStoreTest, IgnoresSpans) {
  MetricStore store;
  store.Update(BatchOf({GetSpanRecord()}), false, kNow);

  EXPECT_EQ(store.series_count(), 0);
  EXPECT_EQ(Render(store), "");
}

}  // namespace
}  // namespace telemetry_relay
