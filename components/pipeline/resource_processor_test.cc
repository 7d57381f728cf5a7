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

#include "components/pipeline/resource_processor.h"

#include <vector>

#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

config::v1::ResourceConfig Attributes(bool overwrite) {
  config::v1::ResourceConfig config;
  (*config.mutable_attributes())["environment"] = "staging";
  (*config.mutable_attributes())["deployment.id"] = "eu-7";
  config.set_overwrite(overwrite);
  return config;
}

TEST(ResourceProcessorTest, AttachesAttributesToEveryRecord) {
  ResourceProcessor processor([] { return Attributes(false); });

  const TelemetryBatch batch = processor.Process(
      TelemetryBatch(std::vector<v1::Record>{GetSpanRecord(),
                                             GetCounterRecord()}));

  ASSERT_EQ(batch.size(), 2);
  for (const v1::Record& record : batch.records()) {
    EXPECT_EQ(record.resource().at("environment").string_value(), "staging");
    EXPECT_EQ(record.resource().at("deployment.id").string_value(), "eu-7");
  }
  EXPECT_TRUE(batch.records()[0].has_span());
  EXPECT_TRUE(batch.records()[1].has_metric());
}

TEST(ResourceProcessorTest, InsertKeepsExistingKeys) {
  v1::Record record = GetSpanRecord();
  (*record.mutable_resource())["environment"].set_string_value("prod");
  ResourceProcessor processor([] { return Attributes(false); });

  const TelemetryBatch batch =
      processor.Process(TelemetryBatch(std::vector<v1::Record>{record}));

  EXPECT_EQ(batch.records()[0].resource().at("environment").string_value(),
            "prod");
}

TEST(ResourceProcessorTest, UpsertReplacesExistingKeys) {
  v1::Record record = GetSpanRecord();
  (*record.mutable_resource())["environment"].set_int_value(3);
  ResourceProcessor processor([] { return Attributes(true); });

  const TelemetryBatch batch =
      processor.Process(TelemetryBatch(std::vector<v1::Record>{record}));

  EXPECT_EQ(batch.records()[0].resource().at("environment").string_value(),
            "staging");
}

TEST(ResourceProcessorTest, AppliesReloadedSettingsToNextBatch) {
  config::v1::ResourceConfig settings = Attributes(false);
  ResourceProcessor processor([&settings] { return settings; });
  (*settings.mutable_attributes())["environment"] = "canary";

  const TelemetryBatch batch = processor.Process(
      TelemetryBatch(std::vector<v1::Record>{GetCounterRecord()}));

  EXPECT_EQ(batch.records()[0].resource().at("environment").string_value(),
            "canary");
}

}  // namespace
}  // namespace telemetry_relay
