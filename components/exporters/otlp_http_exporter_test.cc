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

#include "components/exporters/otlp_http_exporter.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "components/http/mocks.h"
#include "gmock/gmock.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/util/message_differencer.h"
#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using config::v1::ExporterConfig;
using google::protobuf::util::MessageDifferencer;
using testing::_;
using testing::DoAll;
using testing::Eq;
using testing::Return;
using testing::SaveArg;

class OtlpHttpExporterTest : public ::testing::Test {
 protected:
  OtlpHttpExporterTest() {
    config_.set_name("upstream");
    config_.set_protocol(ExporterConfig::PROTOCOL_OTLP_HTTP);
    config_.set_endpoint("http://relay-2:4318/v1/export");
    auto http_client = std::make_unique<MockHttpClient>();
    http_client_ = http_client.get();
    exporter_ = std::make_unique<OtlpHttpExporter>(
        [this] { return config_; }, std::move(http_client));
  }

  TelemetryBatch MixedBatch() {
    return TelemetryBatch(
        std::vector<v1::Record>{GetSpanRecord(), GetCounterRecord()});
  }

  ExporterConfig config_;
  MockHttpClient* http_client_;
  std::unique_ptr<OtlpHttpExporter> exporter_;
};

TEST_F(OtlpHttpExporterTest, PostsBinaryRequest) {
  std::string body;
  EXPECT_CALL(*http_client_, Post(Eq("http://relay-2:4318/v1/export"),
                                  Eq("application/x-protobuf"), _, _))
      .WillOnce(DoAll(SaveArg<2>(&body), Return(JsonResponse(200, "{}"))));

  const TelemetryBatch batch = MixedBatch();
  ASSERT_TRUE(exporter_->Export(batch).ok());

  v1::ExportRequest sent;
  ASSERT_TRUE(sent.ParseFromString(body));
  EXPECT_TRUE(MessageDifferencer::Equals(sent, batch.ToRequest()));
}

TEST_F(OtlpHttpExporterTest, PostsJsonRequest) {
  config_.set_encoding(ExporterConfig::ENCODING_JSON);
  std::string body;
  EXPECT_CALL(*http_client_, Post(_, Eq("application/json"), _, _))
      .WillOnce(DoAll(SaveArg<2>(&body), Return(JsonResponse(200, "{}"))));

  const TelemetryBatch batch = MixedBatch();
  ASSERT_TRUE(exporter_->Export(batch).ok());

  v1::ExportRequest sent;
  ASSERT_TRUE(google::protobuf::util::JsonStringToMessage(body, &sent).ok());
  EXPECT_TRUE(MessageDifferencer::Equals(sent, batch.ToRequest()));
}

TEST_F(OtlpHttpExporterTest, TooManyRequestsIsRetryable) {
  EXPECT_CALL(*http_client_, Post)
      .WillOnce(Return(TextResponse(429, "slow down")));

  EXPECT_TRUE(absl::IsResourceExhausted(exporter_->Export(MixedBatch())));
}

}  // namespace
}  // namespace telemetry_relay
