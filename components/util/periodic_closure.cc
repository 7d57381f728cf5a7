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

#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>

#include "absl/log/log.h"
#include "absl/synchronization/notification.h"

namespace telemetry_relay {
namespace {

class PeriodicClosureImpl : public PeriodicClosure {
 public:
  explicit PeriodicClosureImpl(std::string task_name)
      : task_name_(std::move(task_name)) {}

  ~PeriodicClosureImpl() override { Stop(); }

  absl::Status StartDelayed(IntervalProvider interval,
                            std::function<void()> closure) override {
    if (stop_.HasBeenNotified()) {
      return absl::FailedPreconditionError(task_name_ + " already ran.");
    }
    if (started_.exchange(true)) {
      return absl::FailedPreconditionError(task_name_ + " already running.");
    }
    VLOG(1) << "Starting " << task_name_;
    thread_ = std::make_unique<std::thread>(
        [this, interval = std::move(interval), closure = std::move(closure)] {
          while (!stop_.WaitForNotificationWithTimeout(
              std::max(interval(), kMinInterval))) {
            closure();
          }
        });
    return absl::OkStatus();
  }

  void Stop() override {
    if (thread_ == nullptr || stop_.HasBeenNotified()) {
      return;
    }
    stop_.Notify();
    thread_->join();
    VLOG(1) << "Stopped " << task_name_;
  }

 private:
  static constexpr absl::Duration kMinInterval = absl::Milliseconds(1);

  const std::string task_name_;
  std::atomic<bool> started_ = false;
  std::unique_ptr<std::thread> thread_;
  absl::Notification stop_;
};

}  // namespace

std::unique_ptr<PeriodicClosure> PeriodicClosure::Create(
    std::string task_name) {
  return std::make_unique<PeriodicClosureImpl>(std::move(task_name));
}

}  // namespace telemetry_relay
