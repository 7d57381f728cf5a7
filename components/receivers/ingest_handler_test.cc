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

#include "components/receivers/ingest_handler.h"

#include <memory>
#include <utility>
#include <vector>

#include "components/pipeline/memory_limiter.h"
#include "components/pipeline/pipeline.h"
#include "components/telemetry/mocks.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using testing::_;
using testing::NiceMock;

v1::ExportRequest RequestOf(std::vector<v1::Record> records) {
  v1::ExportRequest request;
  for (v1::Record& record : records) {
    *request.add_records() = std::move(record);
  }
  return request;
}

Fanout NoDestinations() { return Fanout(std::vector<ExporterWorker*>()); }

class IngestHandlerTest : public ::testing::Test {
 protected:
  IngestHandlerTest()
      : traces_("traces", Signal::kTraces, {}, NoDestinations(), 1, stats_),
        handler_("grpc", router_, stats_, metrics_recorder_) {
    traces_.Start();
    router_.AddRoute("grpc", &traces_);
  }

  RelayStats stats_;
  NiceMock<MockMetricsRecorder> metrics_recorder_;
  Pipeline traces_;
  Router router_{stats_};
  IngestHandler handler_;
};

TEST_F(IngestHandlerTest, AcceptsValidRequest) {
  EXPECT_CALL(metrics_recorder_,
              IncrementEventStatus("ingest.grpc", absl::OkStatus(), 1));

  absl::StatusOr<v1::ExportResponse> response = handler_.Handle(
      RequestOf({GetSpanRecord("checkout", "a", "0000000000000001"),
                 GetSpanRecord("checkout", "b", "0000000000000002")}));

  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->accepted_records(), 2);
  EXPECT_EQ(stats_.Snapshot().accepted_records, 2);
}

TEST_F(IngestHandlerTest, RejectsMalformedRecord) {
  EXPECT_CALL(metrics_recorder_, IncrementEventStatus("ingest.grpc", _, 1));

  absl::StatusOr<v1::ExportResponse> response =
      handler_.Handle(RequestOf({GetSpanRecord(), v1::Record()}));

  EXPECT_TRUE(absl::IsInvalidArgument(response.status()));
  EXPECT_EQ(stats_.Snapshot().rejected_requests, 1);
  EXPECT_EQ(stats_.Snapshot().accepted_records, 0);
}

TEST_F(IngestHandlerTest, RejectsRecordsOfTheOtherSignal) {
  absl::StatusOr<v1::ExportResponse> response = handler_.Handle(
      RequestOf({GetSpanRecord(), GetCounterRecord()}), Signal::kTraces);

  EXPECT_TRUE(absl::IsInvalidArgument(response.status()));
  EXPECT_EQ(stats_.Snapshot().rejected_requests, 1);
}

TEST_F(IngestHandlerTest, NoPipelineForTheSignal) {
  absl::StatusOr<v1::ExportResponse> response =
      handler_.Handle(RequestOf({GetCounterRecord()}));

  EXPECT_TRUE(absl::IsFailedPrecondition(response.status()));
  EXPECT_EQ(stats_.Snapshot().rejected_requests, 0);
}

TEST_F(IngestHandlerTest, EmptyRequestAcceptsNothing) {
  absl::StatusOr<v1::ExportResponse> response =
      handler_.Handle(v1::ExportRequest());

  ASSERT_TRUE(response.ok()) << response.status();
  EXPECT_EQ(response->accepted_records(), 0);
}

TEST_F(IngestHandlerTest, UnavailableWhileShuttingDown) {
  router_.StopAccepting();

  EXPECT_TRUE(absl::IsUnavailable(
      handler_.Handle(RequestOf({GetSpanRecord()})).status()));
}

class IngestHandlerBackpressureTest : public ::testing::Test {
 protected:
  // Without started workers admitted batches stay queued and keep their
  // memory reserved.
  IngestHandler& HandlerWithLimits(MemoryLimits limits) {
    limits_ = limits;
    PipelineStages stages;
    stages.memory_limiter = &limiter_;
    traces_ = std::make_unique<Pipeline>("traces", Signal::kTraces,
                                         std::move(stages), NoDestinations(),
                                         1, stats_);
    router_.AddRoute("http", traces_.get());
    return handler_;
  }

  RelayStats stats_;
  NiceMock<MockMetricsRecorder> metrics_recorder_;
  MemoryLimits limits_;
  MemoryLimiter limiter_{"memory", [this] { return limits_; }, stats_};
  Router router_{stats_};
  IngestHandler handler_{"http", router_, stats_, metrics_recorder_};
  std::unique_ptr<Pipeline> traces_;
};

TEST_F(IngestHandlerBackpressureTest, RefusedAboveSoftLimit) {
  IngestHandler& handler = HandlerWithLimits({1, 1 << 20});

  ASSERT_TRUE(handler.Handle(RequestOf({GetSpanRecord()})).ok());
  EXPECT_TRUE(absl::IsResourceExhausted(
      handler.Handle(RequestOf({GetSpanRecord()})).status()));
  EXPECT_EQ(stats_.Snapshot().refused_records, 1);
}

TEST_F(IngestHandlerBackpressureTest, BatchAboveHardLimitIsInvalid) {
  IngestHandler& handler = HandlerWithLimits({10, 10});

  EXPECT_TRUE(absl::IsInvalidArgument(
      handler.Handle(RequestOf({GetSpanRecord()})).status()));
  EXPECT_EQ(stats_.Snapshot().refused_records, 1);
  EXPECT_EQ(limiter_.state(), LimiterState::kNormal);
}

}  // namespace
}  // namespace telemetry_relay
