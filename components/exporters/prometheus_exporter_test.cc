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

#include "components/exporters/prometheus_exporter.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "components/config/pipeline_config.h"
#include "components/http/http_client.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using config::v1::ExporterConfig;
using testing::HasSubstr;
using testing::Not;

class PrometheusExporterTest : public ::testing::Test {
 protected:
  PrometheusExporterTest() : exporter_([this] { return config_; }) {
    config_.set_name("prometheus");
    config_.set_protocol(ExporterConfig::PROTOCOL_PROMETHEUS);
    config_.set_endpoint("127.0.0.1:0");
  }

  void SetUp() override { ASSERT_TRUE(exporter_.Start().ok()); }
  void TearDown() override { exporter_.Shutdown(); }

  std::string Url(absl::string_view path) {
    return absl::StrCat("http://127.0.0.1:", exporter_.port(), path);
  }

  ExporterConfig config_;
  PrometheusExporter exporter_;
  std::unique_ptr<HttpClient> http_client_ = HttpClient::Create();
};

TEST_F(PrometheusExporterTest, ServesExportedMetrics) {
  v1::Record record = GetCounterRecord("orders_total", 1);
  (*record.mutable_resource())["environment"].set_string_value("staging");
  ASSERT_TRUE(
      exporter_.Export(TelemetryBatch(std::vector<v1::Record>{record})).ok());

  absl::StatusOr<HttpResponse> response =
      http_client_->Get(Url("/metrics"), absl::Seconds(5));

  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status_code, 200);
  EXPECT_THAT(response->content_type, HasSubstr("text/plain"));
  EXPECT_THAT(response->body, HasSubstr("# TYPE orders_total counter\n"));
  EXPECT_THAT(response->body, HasSubstr("\norders_total 1\n"));
}

TEST_F(PrometheusExporterTest, AddsResourceLabelsWhenConfigured) {
  config_.set_resource_to_telemetry_conversion(true);
  v1::Record record = GetCounterRecord("orders_total", 1);
  (*record.mutable_resource())["environment"].set_string_value("staging");
  ASSERT_TRUE(
      exporter_.Export(TelemetryBatch(std::vector<v1::Record>{record})).ok());

  absl::StatusOr<HttpResponse> response =
      http_client_->Get(Url("/metrics"), absl::Seconds(5));

  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_THAT(response->body,
              HasSubstr("orders_total{environment=\"staging\"} 1\n"));
}

TEST_F(PrometheusExporterTest, ExpiresSeriesWithoutScrapes) {
  config_.set_metric_expiration_ms(50);
  ASSERT_TRUE(exporter_
                  .Export(TelemetryBatch(
                      std::vector<v1::Record>{GetGaugeRecord("old", 1)}))
                  .ok());
  ASSERT_EQ(exporter_.store().series_count(), 1);

  const absl::Time deadline = absl::Now() + absl::Seconds(10);
  while (exporter_.store().series_count() > 0 && absl::Now() < deadline) {
    absl::SleepFor(absl::Milliseconds(10));
  }
  EXPECT_EQ(exporter_.store().series_count(), 0);

  absl::StatusOr<HttpResponse> response =
      http_client_->Get(Url("/metrics"), absl::Seconds(5));
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_THAT(response->body, Not(HasSubstr("old")));
}

TEST_F(PrometheusExporterTest, KeepsFreshSeries) {
  ASSERT_TRUE(exporter_
                  .Export(TelemetryBatch(
                      std::vector<v1::Record>{GetGaugeRecord("fresh", 1)}))
                  .ok());

  absl::SleepFor(absl::Milliseconds(100));
  EXPECT_EQ(exporter_.store().series_count(), 1);
}

TEST(PrometheusExporterStartTest, PortInUseIsUnavailable) {
  ExporterConfig config;
  config.set_name("first");
  config.set_protocol(ExporterConfig::PROTOCOL_PROMETHEUS);
  config.set_endpoint("127.0.0.1:0");
  PrometheusExporter first([&config] { return config; });
  ASSERT_TRUE(first.Start().ok());

  ExporterConfig taken = config;
  taken.set_name("second");
  taken.set_endpoint(absl::StrCat("127.0.0.1:", first.port()));
  PrometheusExporter second([&taken] { return taken; });
  EXPECT_TRUE(absl::IsUnavailable(second.Start()));
  EXPECT_EQ(second.port(), 0);
}

// The shipped sample config must expose exported series under their plain
// names, without resource attributes folded into the labels.
TEST(PrometheusExporterSampleConfigTest, ExposesPlainSeries) {
  absl::StatusOr<PipelineConfig> sample =
      LoadPipelineConfig(TELEMETRY_RELAY_SAMPLE_CONFIG);
  ASSERT_TRUE(sample.ok()) << sample.status();
  const ExporterConfig* shipped = FindExporter(*sample, "prometheus");
  ASSERT_NE(shipped, nullptr);
  ExporterConfig config = *shipped;
  config.set_endpoint("127.0.0.1:0");
  PrometheusExporter exporter([&config] { return config; });
  ASSERT_TRUE(exporter.Start().ok());

  v1::Record record = GetCounterRecord("orders_total", 1);
  (*record.mutable_resource())["environment"].set_string_value("staging");
  (*record.mutable_resource())["deployment_id"].set_string_value("relay-1");
  ASSERT_TRUE(
      exporter.Export(TelemetryBatch(std::vector<v1::Record>{record})).ok());

  absl::StatusOr<HttpResponse> response = HttpClient::Create()->Get(
      absl::StrCat("http://127.0.0.1:", exporter.port(), "/metrics"),
      absl::Seconds(5));
  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_THAT(response->body, HasSubstr("\norders_total 1\n"));
  exporter.Shutdown();
}

TEST_F(PrometheusExporterTest, UnknownPath) {
  absl::StatusOr<HttpResponse> response =
      http_client_->Get(Url("/federate"), absl::Seconds(5));

  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->status_code, 404);
}

}  // namespace
}  // namespace telemetry_relay
