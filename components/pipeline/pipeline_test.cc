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

#include "components/pipeline/pipeline.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "components/exporters/exporter_worker.h"
#include "components/pipeline/router.h"
#include "components/telemetry/mocks.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using testing::NiceMock;

class RecordingExporter : public Exporter {
 public:
  absl::Status Export(const TelemetryBatch& batch) override {
    absl::MutexLock lock(&mutex_);
    ++batches_;
    records_.insert(records_.end(), batch.records().begin(),
                    batch.records().end());
    return absl::OkStatus();
  }

  absl::Status CheckConnectivity() override { return absl::OkStatus(); }

  std::vector<v1::Record> records() {
    absl::MutexLock lock(&mutex_);
    return records_;
  }

 private:
  absl::Mutex mutex_;
  int batches_ ABSL_GUARDED_BY(mutex_) = 0;
  std::vector<v1::Record> records_ ABSL_GUARDED_BY(mutex_);
};

TelemetryBatch BatchOf(std::vector<v1::Record> records) {
  return TelemetryBatch(std::move(records));
}

class PipelineTest : public ::testing::Test {
 protected:
  PipelineTest() {
    exporter_config_.set_name("recording");
    auto exporter = std::make_unique<RecordingExporter>();
    exporter_ = exporter.get();
    worker_ = std::make_unique<ExporterWorker>(
        "recording", std::move(exporter),
        [this] { return exporter_config_; }, stats_, metrics_recorder_);
    worker_->Start();
  }

  ~PipelineTest() override {
    for (auto& pipeline : pipelines_) {
      pipeline->Shutdown(absl::Now() + absl::Seconds(10));
    }
    worker_->Shutdown(absl::Now() + absl::Seconds(10));
  }

  Pipeline* AddPipeline(std::string name, Signal signal,
                        PipelineStages stages, bool start = true) {
    pipelines_.push_back(std::make_unique<Pipeline>(
        std::move(name), signal, std::move(stages), Fanout({worker_.get()}),
        /*num_workers=*/2, stats_));
    if (start) {
      pipelines_.back()->Start();
    }
    return pipelines_.back().get();
  }

  // Waits for queued work to reach the exporter.
  void Drain() {
    for (auto& pipeline : pipelines_) {
      pipeline->Shutdown(absl::Now() + absl::Seconds(10));
    }
    worker_->Shutdown(absl::Now() + absl::Seconds(10));
  }

  RelayStats stats_;
  NiceMock<MockMetricsRecorder> metrics_recorder_;
  config::v1::ExporterConfig exporter_config_;
  RecordingExporter* exporter_;
  std::unique_ptr<ExporterWorker> worker_;
  std::vector<std::unique_ptr<Pipeline>> pipelines_;
  Router router_{stats_};
};

TEST_F(PipelineTest, AttributesBatchesAndExports) {
  config::v1::ResourceConfig resource;
  (*resource.mutable_attributes())["environment"] = "staging";
  config::v1::BatchConfig batch;
  batch.set_send_batch_size(100);
  batch.set_timeout_ms(20);
  PipelineStages stages;
  stages.resource = [resource] { return resource; };
  stages.batch = [batch] { return batch; };
  router_.AddRoute("grpc",
                   AddPipeline("traces", Signal::kTraces, std::move(stages)));

  absl::StatusOr<uint64_t> accepted = router_.Submit(
      "grpc",
      BatchOf({GetSpanRecord("checkout", "first", "0000000000000001"),
               GetSpanRecord("checkout", "second", "0000000000000002")}));
  ASSERT_TRUE(accepted.ok()) << accepted.status();
  EXPECT_EQ(*accepted, 2);
  Drain();

  const std::vector<v1::Record> records = exporter_->records();
  ASSERT_EQ(records.size(), 2);
  EXPECT_EQ(records[0].span().name(), "first");
  EXPECT_EQ(records[1].span().name(), "second");
  EXPECT_EQ(records[0].resource().at("environment").string_value(), "staging");
  EXPECT_EQ(stats_.Snapshot().accepted_records, 2);
  EXPECT_EQ(stats_.Snapshot().exporters["recording"].sent_records, 2);
}

TEST_F(PipelineTest, SplitsRecordsBySignal) {
  router_.AddRoute("http", AddPipeline("traces", Signal::kTraces, {}));
  router_.AddRoute("http", AddPipeline("metrics", Signal::kMetrics, {}));

  absl::StatusOr<uint64_t> accepted = router_.Submit(
      "http", BatchOf({GetSpanRecord(), GetCounterRecord(), GetSpanRecord()}));
  ASSERT_TRUE(accepted.ok());
  EXPECT_EQ(*accepted, 3);
  Drain();

  EXPECT_EQ(exporter_->records().size(), 3);
  EXPECT_EQ(stats_.Snapshot().unrouted_records, 0);
}

TEST_F(PipelineTest, ResubmittedBatchIsProcessedAgain) {
  router_.AddRoute("grpc", AddPipeline("traces", Signal::kTraces, {}));
  const TelemetryBatch batch = BatchOf({GetSpanRecord()});

  ASSERT_TRUE(router_.Submit("grpc", batch).ok());
  ASSERT_TRUE(router_.Submit("grpc", batch).ok());
  Drain();

  EXPECT_EQ(exporter_->records().size(), 2);
}

TEST_F(PipelineTest, UncarriedSignalIsCountedAsUnrouted) {
  router_.AddRoute("grpc", AddPipeline("traces", Signal::kTraces, {}));

  absl::StatusOr<uint64_t> accepted =
      router_.Submit("grpc", BatchOf({GetSpanRecord(), GetCounterRecord()}));

  ASSERT_TRUE(accepted.ok());
  EXPECT_EQ(*accepted, 1);
  EXPECT_EQ(stats_.Snapshot().unrouted_records, 1);
}

TEST_F(PipelineTest, NoPipelineForAnyRecordIsAFailedPrecondition) {
  router_.AddRoute("grpc", AddPipeline("metrics", Signal::kMetrics, {}));

  EXPECT_TRUE(absl::IsFailedPrecondition(
      router_.Submit("grpc", BatchOf({GetSpanRecord()})).status()));
  EXPECT_TRUE(absl::IsFailedPrecondition(
      router_.Submit("unknown", BatchOf({GetCounterRecord()})).status()));
  EXPECT_TRUE(router_.Submit("grpc", TelemetryBatch()).ok());
  EXPECT_EQ(stats_.Snapshot().unrouted_records, 2);
}

TEST_F(PipelineTest, RefusalByOnePipelineRejectsTheWholeBatch) {
  MemoryLimiter limiter("tiny", [] { return MemoryLimits{10, 10}; }, stats_);
  PipelineStages limited;
  limited.memory_limiter = &limiter;
  Pipeline* metrics = AddPipeline("metrics", Signal::kMetrics, {},
                                  /*start=*/false);
  router_.AddRoute("grpc", metrics);
  router_.AddRoute("grpc", AddPipeline("traces", Signal::kTraces,
                                       std::move(limited), /*start=*/false));

  const absl::StatusOr<uint64_t> accepted =
      router_.Submit("grpc", BatchOf({GetCounterRecord(), GetSpanRecord()}));

  EXPECT_TRUE(absl::IsInvalidArgument(accepted.status()));
  EXPECT_EQ(metrics->queue_depth(), 0);
  EXPECT_EQ(limiter.usage_bytes(), 0);
  EXPECT_EQ(stats_.Snapshot().accepted_records, 0);
  pipelines_.back()->Shutdown(absl::Now());
  pipelines_.pop_back();
}

TEST_F(PipelineTest, HardLimitEvictsOldestQueuedBatch) {
  const uint64_t batch_bytes = BatchOf({GetSpanRecord()}).ByteSize();
  MemoryLimiter limiter(
      "memory",
      [batch_bytes] {
        return MemoryLimits{batch_bytes * 3 / 2, batch_bytes * 3 / 2};
      },
      stats_);
  PipelineStages stages;
  stages.memory_limiter = &limiter;
  Pipeline* pipeline = AddPipeline("traces", Signal::kTraces,
                                   std::move(stages), /*start=*/false);
  router_.AddRoute("grpc", pipeline);

  ASSERT_TRUE(router_.Submit("grpc", BatchOf({GetSpanRecord()})).ok());
  ASSERT_TRUE(router_.Submit("grpc", BatchOf({GetSpanRecord()})).ok());

  EXPECT_EQ(pipeline->queue_depth(), 1);
  EXPECT_EQ(stats_.Snapshot().evicted_records, 1);
  EXPECT_LE(limiter.peak_usage_bytes(), batch_bytes * 3 / 2);
  pipeline->Shutdown(absl::Now());
  EXPECT_EQ(stats_.Snapshot().shutdown_dropped_records, 1);
  EXPECT_EQ(limiter.usage_bytes(), 0);
  pipelines_.pop_back();
}

TEST_F(PipelineTest, StoppedRouterIsUnavailable) {
  router_.AddRoute("grpc", AddPipeline("traces", Signal::kTraces, {}));
  router_.StopAccepting();

  EXPECT_TRUE(absl::IsUnavailable(
      router_.Submit("grpc", BatchOf({GetSpanRecord()})).status()));
}

}  // namespace
}  // namespace telemetry_relay
