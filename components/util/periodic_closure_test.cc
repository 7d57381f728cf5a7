// Copyright 2022 Google LLC
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

#include "components/util/periodic_closure.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "gtest/gtest.h"

namespace telemetry_relay {
namespace {

TEST(PeriodicClosureTest, StartDelayed) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  absl::Notification notification;
  constexpr absl::Duration delay = absl::Milliseconds(2);
  const absl::Time start = absl::Now();
  absl::Time delayed_start;
  ASSERT_TRUE(periodic_closure
                  ->StartDelayed(delay,
                                 [&delayed_start, &notification]() {
                                   delayed_start = absl::Now();
                                   notification.Notify();
                                 })
                  .ok());
  notification.WaitForNotification();
  ASSERT_GE(delayed_start - start, delay);
}

TEST(PeriodicClosureTest, Stop) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  absl::Notification notification;
  std::atomic<int32_t> count = 0;
  ASSERT_TRUE(periodic_closure
                  ->StartDelayed(
                      [&count] {
                        return count == 0 ? absl::Milliseconds(1)
                                          : absl::Minutes(1);
                      },
                      [&count, &notification]() {
                        count++;
                        notification.Notify();
                      })
                  .ok());
  notification.WaitForNotification();
  const absl::Time stop_start = absl::Now();
  periodic_closure->Stop();
  EXPECT_LT(absl::Now() - stop_start, absl::Seconds(10));
  ASSERT_EQ(count.load(), 1);
}

TEST(PeriodicClosureTest, StartWhileStarted) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  absl::Notification notification;
  int32_t count = 0;
  ASSERT_TRUE(periodic_closure
                  ->StartDelayed(absl::Milliseconds(1),
                                 [&]() {
                                   if (notification.HasBeenNotified()) {
                                     return;
                                   }
                                   count++;
                                   ASSERT_FALSE(
                                       periodic_closure
                                           ->StartDelayed(
                                               absl::Milliseconds(1),
                                               [&count]() { count++; })
                                           .ok());
                                   notification.Notify();
                                 })
                  .ok());
  notification.WaitForNotification();
  periodic_closure->Stop();
  ASSERT_EQ(count, 1);
}

TEST(PeriodicClosureTest, StartAfterStopped) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  ASSERT_TRUE(
      periodic_closure->StartDelayed(absl::Milliseconds(1), []() {}).ok());
  periodic_closure->Stop();
  ASSERT_FALSE(
      periodic_closure->StartDelayed(absl::Milliseconds(1), []() {}).ok());
}

TEST(PeriodicClosureTest, StopWithoutStartIsNoop) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  periodic_closure->Stop();
  ASSERT_TRUE(periodic_closure->StartDelayed(absl::Minutes(1), []() {}).ok());
}

TEST(PeriodicClosureTest, RunsRepeatedly) {
  std::unique_ptr<PeriodicClosure> periodic_closure =
      PeriodicClosure::Create("series expiry");
  absl::Notification notification;
  std::atomic<int32_t> count = 0;
  ASSERT_TRUE(periodic_closure
                  ->StartDelayed(absl::Milliseconds(1),
                                 [&count, &notification]() {
                                   if (++count == 3) {
                                     notification.Notify();
                                   }
                                 })
                  .ok());
  notification.WaitForNotification();
  periodic_closure->Stop();
  ASSERT_GE(count.load(), 3);
}

TEST(PeriodicClosureTest, RereadsIntervalBeforeEveryWait) {
  std::unique_ptr<PeriodicClosure> periodic_closure = PeriodicClosure::Create();
  absl::Notification notification;
  std::atomic<bool> slow = false;
  std::atomic<int32_t> runs = 0;
  ASSERT_TRUE(periodic_closure
                  ->StartDelayed(
                      [&slow] {
                        return slow ? absl::Hours(1) : absl::Milliseconds(1);
                      },
                      [&] {
                        ++runs;
                        slow = true;
                        notification.Notify();
                      })
                  .ok());
  notification.WaitForNotification();
  absl::SleepFor(absl::Milliseconds(100));
  periodic_closure->Stop();
  EXPECT_EQ(runs.load(), 1);
}

}  // namespace
}  // namespace telemetry_relay
