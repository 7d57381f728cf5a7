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

#include "components/exporters/exporter_worker.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/synchronization/notification.h"
#include "components/exporters/fanout.h"
#include "components/exporters/mocks.h"
#include "components/telemetry/mocks.h"
#include "components/util/sleepfor_mock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using config::v1::ExporterConfig;
using testing::_;
using testing::NiceMock;
using testing::Return;

TelemetryBatch SpanBatch(size_t num_spans) {
  return TelemetryBatch(std::vector<v1::Record>(num_spans, GetSpanRecord()));
}

ExportJobPtr MakeJob(size_t num_spans,
                     std::vector<ReservationPtr> reservations = {}) {
  auto job = std::make_shared<ExportJob>();
  job->batch = std::make_shared<const TelemetryBatch>(SpanBatch(num_spans));
  job->reservations = std::move(reservations);
  return job;
}

std::unique_ptr<SleepFor> NoWaitSleep() {
  auto sleep_for = std::make_unique<NiceMock<MockSleepFor>>();
  ON_CALL(*sleep_for, Duration(_)).WillByDefault(Return(true));
  return sleep_for;
}

class ExporterWorkerTest : public ::testing::Test {
 protected:
  ExporterWorkerTest() {
    config_.set_name("zipkin");
    config_.set_protocol(ExporterConfig::PROTOCOL_ZIPKIN);
    config_.mutable_retry()->set_max_attempts(3);
  }

  std::unique_ptr<ExporterWorker> MakeWorker(
      std::string name, std::unique_ptr<Exporter> exporter,
      std::unique_ptr<SleepFor> sleep_for = NoWaitSleep()) {
    return std::make_unique<ExporterWorker>(
        std::move(name), std::move(exporter), [this] { return config_; },
        stats_, metrics_recorder_, std::move(sleep_for));
  }

  ExporterCountersSnapshot Counters(const std::string& name) {
    return stats_.Snapshot().exporters[name];
  }

  ExporterConfig config_;
  RelayStats stats_;
  NiceMock<MockMetricsRecorder> metrics_recorder_;
};

TEST_F(ExporterWorkerTest, RetriesRetryableFailureThenSucceeds) {
  auto exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*exporter, Export(_))
      .WillOnce(Return(absl::UnavailableError("connection refused")))
      .WillOnce(Return(absl::OkStatus()));
  auto worker = MakeWorker("zipkin", std::move(exporter));
  worker->Start();

  EXPECT_TRUE(worker->Enqueue(MakeJob(2)));
  worker->Shutdown(absl::Now() + absl::Seconds(10));

  const ExporterCountersSnapshot counters = Counters("zipkin");
  EXPECT_EQ(counters.attempts, 2);
  EXPECT_EQ(counters.sent_batches, 1);
  EXPECT_EQ(counters.sent_records, 2);
  EXPECT_EQ(counters.failed_batches, 0);
}

TEST_F(ExporterWorkerTest, NonRetryableFailureEndsDelivery) {
  auto exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*exporter, Export(_))
      .WillOnce(Return(absl::InvalidArgumentError("400 Bad Request")));
  auto worker = MakeWorker("zipkin", std::move(exporter));
  worker->Start();

  EXPECT_TRUE(worker->Enqueue(MakeJob(3)));
  worker->Shutdown(absl::Now() + absl::Seconds(10));

  const ExporterCountersSnapshot counters = Counters("zipkin");
  EXPECT_EQ(counters.attempts, 1);
  EXPECT_EQ(counters.failed_batches, 1);
  EXPECT_EQ(counters.failed_records, 3);
}

TEST_F(ExporterWorkerTest, DropsAfterMaxAttempts) {
  auto exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*exporter, Export(_))
      .Times(3)
      .WillRepeatedly(Return(absl::UnavailableError("down")));
  auto worker = MakeWorker("zipkin", std::move(exporter));
  worker->Start();

  EXPECT_TRUE(worker->Enqueue(MakeJob(1)));
  worker->Shutdown(absl::Now() + absl::Seconds(10));

  EXPECT_EQ(Counters("zipkin").failed_batches, 1);
  EXPECT_EQ(stats_.Snapshot().shutdown_dropped_records, 0);
}

TEST_F(ExporterWorkerTest, FullQueueDropsBatch) {
  config_.set_queue_size(1);
  auto exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*exporter, Export(_)).Times(0);
  EXPECT_CALL(*exporter, Shutdown());
  // Not started, so nothing drains the queue.
  auto worker = MakeWorker("zipkin", std::move(exporter));

  EXPECT_TRUE(worker->Enqueue(MakeJob(1)));
  EXPECT_FALSE(worker->Enqueue(MakeJob(4)));
  EXPECT_EQ(worker->queue_depth(), 1);
  worker->Shutdown(absl::Now());

  const ExporterCountersSnapshot counters = Counters("zipkin");
  EXPECT_EQ(counters.dropped_batches, 1);
  EXPECT_EQ(counters.dropped_records, 4);
  EXPECT_EQ(stats_.Snapshot().shutdown_dropped_records, 1);
}

TEST_F(ExporterWorkerTest, ShutdownInterruptsBackoff) {
  config_.mutable_retry()->set_initial_backoff_ms(3600 * 1000);
  config_.mutable_retry()->set_max_backoff_ms(3600 * 1000);
  absl::Notification attempted;
  auto exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*exporter, Export(_)).WillOnce([&attempted] {
    attempted.Notify();
    return absl::UnavailableError("down");
  });
  auto worker = MakeWorker("zipkin", std::move(exporter),
                           std::make_unique<SleepFor>());
  worker->Start();

  EXPECT_TRUE(worker->Enqueue(MakeJob(5)));
  attempted.WaitForNotification();
  worker->Shutdown(absl::Now());

  EXPECT_EQ(Counters("zipkin").failed_batches, 0);
  EXPECT_EQ(stats_.Snapshot().shutdown_dropped_records, 5);
}

TEST_F(ExporterWorkerTest, EnqueueAfterShutdownIsDropped) {
  auto worker =
      MakeWorker("zipkin", std::make_unique<NiceMock<MockExporter>>());
  worker->Start();
  worker->Shutdown(absl::Now() + absl::Seconds(10));

  EXPECT_FALSE(worker->Enqueue(MakeJob(2)));
  EXPECT_EQ(stats_.Snapshot().shutdown_dropped_records, 2);
}

TEST_F(ExporterWorkerTest, FailingDestinationDoesNotAffectOthers) {
  auto failing = std::make_unique<NiceMock<MockExporter>>();
  ON_CALL(*failing, Export(_))
      .WillByDefault(Return(absl::UnavailableError("down")));
  auto healthy = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*healthy, Export(_))
      .Times(20)
      .WillRepeatedly(Return(absl::OkStatus()));
  auto jaeger = MakeWorker("jaeger", std::move(failing));
  auto zipkin = MakeWorker("zipkin", std::move(healthy));
  jaeger->Start();
  zipkin->Start();
  Fanout fanout({jaeger.get(), zipkin.get()});

  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(fanout.Dispatch(SpanBatch(1), {}), 2);
  }
  jaeger->Shutdown(absl::Now() + absl::Seconds(10));
  zipkin->Shutdown(absl::Now() + absl::Seconds(10));

  EXPECT_EQ(Counters("zipkin").sent_records, 20);
  EXPECT_EQ(Counters("jaeger").failed_records, 20);
}

TEST_F(ExporterWorkerTest, DestinationsShareOneBatch) {
  const TelemetryBatch* seen_by_jaeger = nullptr;
  const TelemetryBatch* seen_by_zipkin = nullptr;
  auto jaeger_exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*jaeger_exporter, Export(_))
      .WillOnce([&seen_by_jaeger](const TelemetryBatch& batch) {
        seen_by_jaeger = &batch;
        return absl::OkStatus();
      });
  auto zipkin_exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*zipkin_exporter, Export(_))
      .WillOnce([&seen_by_zipkin](const TelemetryBatch& batch) {
        seen_by_zipkin = &batch;
        return absl::OkStatus();
      });
  auto jaeger = MakeWorker("jaeger", std::move(jaeger_exporter));
  auto zipkin = MakeWorker("zipkin", std::move(zipkin_exporter));
  jaeger->Start();
  zipkin->Start();

  Fanout({jaeger.get(), zipkin.get()})
      .Dispatch(SpanBatch(1), {});
  jaeger->Shutdown(absl::Now() + absl::Seconds(10));
  zipkin->Shutdown(absl::Now() + absl::Seconds(10));

  ASSERT_NE(seen_by_jaeger, nullptr);
  EXPECT_EQ(seen_by_jaeger, seen_by_zipkin);
}

TEST_F(ExporterWorkerTest, ReservationHeldUntilLastDestinationFinishes) {
  MemoryLimiter limiter(
      "memory", [] { return MemoryLimits{1000, 2000}; }, stats_);
  absl::StatusOr<ReservationPtr> reservation = limiter.Reserve(100, 1);
  ASSERT_TRUE(reservation.ok());

  absl::Notification release_slow;
  absl::Notification fast_done;
  auto slow_exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*slow_exporter, Export(_)).WillOnce([&release_slow] {
    release_slow.WaitForNotification();
    return absl::OkStatus();
  });
  auto fast_exporter = std::make_unique<NiceMock<MockExporter>>();
  EXPECT_CALL(*fast_exporter, Export(_)).WillOnce([&fast_done] {
    fast_done.Notify();
    return absl::OkStatus();
  });
  auto slow = MakeWorker("slow", std::move(slow_exporter));
  auto fast = MakeWorker("fast", std::move(fast_exporter));
  slow->Start();
  fast->Start();

  Fanout({slow.get(), fast.get()})
      .Dispatch(SpanBatch(1), {*std::move(reservation)});
  fast_done.WaitForNotification();
  fast->Shutdown(absl::Now() + absl::Seconds(10));
  EXPECT_EQ(limiter.usage_bytes(), 100);

  release_slow.Notify();
  slow->Shutdown(absl::Now() + absl::Seconds(10));
  EXPECT_EQ(limiter.usage_bytes(), 0);
}

}  // namespace
}  // namespace telemetry_relay
