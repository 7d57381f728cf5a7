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

#include "components/health/health_reporter.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/synchronization/notification.h"
#include "components/exporters/mocks.h"
#include "components/receivers/mocks.h"
#include "components/util/sleepfor_mock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace telemetry_relay {
namespace {

using testing::_;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRefOfCopy;

std::unique_ptr<SleepFor> NoWaitSleep() {
  auto sleep_for = std::make_unique<NiceMock<MockSleepFor>>();
  ON_CALL(*sleep_for, Duration(_)).WillByDefault(Return(true));
  return sleep_for;
}

class HealthReporterTest : public ::testing::Test {
 protected:
  HealthReporterTest() {
    ON_CALL(receiver_, name())
        .WillByDefault(ReturnRefOfCopy(std::string("grpc")));
    ON_CALL(receiver_, IsListening()).WillByDefault(Return(true));
  }

  // Polls until the check of `exporter` succeeded.
  static bool WaitReachable(const HealthReporter& reporter,
                            absl::string_view exporter) {
    const absl::Time deadline = absl::Now() + absl::Seconds(10);
    while (absl::Now() < deadline) {
      if (reporter.IsReachable(exporter)) {
        return true;
      }
      absl::SleepFor(absl::Milliseconds(5));
    }
    return false;
  }

  NiceMock<MockReceiver> receiver_;
  MockExporter exporter_;
};

TEST_F(HealthReporterTest, ReadyOnceExportersAreReachable) {
  EXPECT_CALL(exporter_, CheckConnectivity())
      .WillOnce(Return(absl::UnavailableError("connection refused")))
      .WillOnce(Return(absl::OkStatus()));
  HealthReporter reporter({&receiver_}, {{"zipkin", &exporter_, false}}, {},
                          NoWaitSleep());

  const Readiness before = reporter.GetReadiness();
  EXPECT_FALSE(before.ready);
  EXPECT_THAT(before.reasons,
              ElementsAre(HasSubstr("exporter zipkin has not passed")));

  reporter.StartConnectivityChecks();
  ASSERT_TRUE(WaitReachable(reporter, "zipkin"));

  const Readiness after = reporter.GetReadiness();
  EXPECT_TRUE(after.ready);
  EXPECT_THAT(after.reasons, IsEmpty());
}

TEST_F(HealthReporterTest, BestEffortExportersAreNotChecked) {
  EXPECT_CALL(exporter_, CheckConnectivity()).Times(0);
  HealthReporter reporter({&receiver_}, {{"logging", &exporter_, true}}, {},
                          NoWaitSleep());
  reporter.StartConnectivityChecks();

  EXPECT_TRUE(reporter.GetReadiness().ready);
}

TEST_F(HealthReporterTest, ReceiverNotListening) {
  EXPECT_CALL(receiver_, IsListening()).WillRepeatedly(Return(false));
  HealthReporter reporter({&receiver_}, {}, {}, NoWaitSleep());

  EXPECT_THAT(reporter.GetReadiness().reasons,
              ElementsAre("receiver grpc is not listening"));
}

TEST_F(HealthReporterTest, HardLimitedLimiterIsNotReady) {
  RelayStats stats;
  MemoryLimiter limiter("limiter", [] { return MemoryLimits{50, 100}; },
                        stats);
  HealthReporter reporter({&receiver_}, {}, {&limiter}, NoWaitSleep());
  ASSERT_TRUE(reporter.GetReadiness().ready);

  absl::StatusOr<ReservationPtr> held = limiter.Reserve(40, 1);
  ASSERT_TRUE(held.ok());
  ASSERT_TRUE(absl::IsResourceExhausted(limiter.Reserve(80, 1).status()));

  EXPECT_THAT(reporter.GetReadiness().reasons,
              ElementsAre("memory limiter limiter is hard limited"));
  held->reset();
  EXPECT_TRUE(reporter.GetReadiness().ready);
}

TEST_F(HealthReporterTest, OversizedBatchKeepsRelayReady) {
  RelayStats stats;
  MemoryLimiter limiter("limiter", [] { return MemoryLimits{50, 100}; },
                        stats);
  HealthReporter reporter({&receiver_}, {}, {&limiter}, NoWaitSleep());

  ASSERT_TRUE(absl::IsInvalidArgument(limiter.Reserve(150, 1).status()));

  EXPECT_TRUE(reporter.GetReadiness().ready);
}

TEST_F(HealthReporterTest, StopInterruptsPendingChecks) {
  absl::Notification checked;
  EXPECT_CALL(exporter_, CheckConnectivity()).WillRepeatedly([&checked] {
    if (!checked.HasBeenNotified()) {
      checked.Notify();
    }
    return absl::UnavailableError("connection refused");
  });
  HealthReporter reporter({&receiver_}, {{"otlp", &exporter_, false}}, {});
  reporter.StartConnectivityChecks();
  checked.WaitForNotification();

  reporter.Stop();

  EXPECT_FALSE(reporter.IsReachable("otlp"));
  EXPECT_FALSE(reporter.GetReadiness().ready);
}

}  // namespace
}  // namespace telemetry_relay
