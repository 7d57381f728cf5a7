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

#ifndef COMPONENTS_ERRORS_RETRY_H_
#define COMPONENTS_ERRORS_RETRY_H_

#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "components/util/sleepfor.h"

namespace telemetry_relay {

using MetricsCallback = std::function<void(const absl::Status&, int)>;

// Use where a retry helper needs a metrics callback and there is nothing to
// record.
inline MetricsCallback LogMetricsNoOpCallback() {
  return [](const absl::Status&, int) {};
}

// Shape of the wait between two attempts.
struct BackoffPolicy {
  absl::Duration initial_backoff = absl::Seconds(2);
  absl::Duration max_backoff = absl::Minutes(2);
  double multiplier = 2.0;
};

// Backoff after attempt number `retries` (starting at 1):
// `initial_backoff * multiplier^(retries - 1)` capped at `max_backoff`.
absl::Duration ExponentialBackoffForRetry(uint32_t retries,
                                          const BackoffPolicy& policy);

// Whether an operation that failed with `status` may succeed when repeated.
// Transport and overload failures are retryable, rejections of the request
// itself are not.
bool IsRetryableStatus(const absl::Status& status);

// You shouldn't need to instantiate this class.
// Use `RetryWithMax/RetryUntilOk` which creates one for you.
template <typename Func>
class RetryableWithMax {
 public:
  // Special retry value to denote unlimited retries. Made public for better
  // documentation purposes at call sites.
  static constexpr int kUnlimitedRetry = -1;

  // If max_attempts <= 0, will retry until OK.
  // When `stop_on_permanent_error` is set, a status that is not
  // `IsRetryableStatus` ends the loop right away.
  RetryableWithMax(Func&& f, std::string task_name, int max_attempts,
                   const MetricsCallback& metrics_callback,
                   const SleepFor& sleep_for, BackoffPolicy backoff_policy,
                   bool stop_on_permanent_error)
      : func_(std::forward<Func>(f)),
        task_name_(std::move(task_name)),
        max_attempts_(max_attempts <= 0 ? kUnlimitedRetry : max_attempts),
        metrics_callback_(metrics_callback),
        sleep_for_(sleep_for),
        backoff_policy_(backoff_policy),
        stop_on_permanent_error_(stop_on_permanent_error) {}

  absl::Status ToStatus(absl::Status& result) { return result; }

  template <typename = typename std::enable_if_t<
                !std::is_same<std::invoke_result<Func>, absl::Status>::value>>
  absl::Status ToStatus(std::invoke_result_t<Func>& result) {
    return result.status();
  }

  typename std::invoke_result_t<Func> operator()() {
    std::invoke_result_t<Func> result = func_();
    for (int i = 1;; ++i) {
      const absl::Status status = ToStatus(result);
      if (metrics_callback_) {
        metrics_callback_(status, 1);
      }
      if (status.ok()) {
        return result;
      }
      LOG(WARNING) << task_name_ << " failed with " << status
                   << " for Attempt " << i;
      if (stop_on_permanent_error_ && !IsRetryableStatus(status)) {
        return result;
      }
      if (max_attempts_ != kUnlimitedRetry && i >= max_attempts_) {
        return result;
      }
      const absl::Duration backoff =
          ExponentialBackoffForRetry(i, backoff_policy_);
      if (!sleep_for_.Duration(backoff)) {
        return absl::CancelledError(
            absl::StrCat("SleepFor cancelled for retries of ", task_name_));
      }
      result = func_();
    }
  }

 private:
  Func func_;
  std::string task_name_;
  int max_attempts_;
  const MetricsCallback& metrics_callback_;
  const SleepFor& sleep_for_;
  BackoffPolicy backoff_policy_;
  bool stop_on_permanent_error_;
};

// Retries functors that return an absl::Status until they are `ok` or
// `sleep_for` is stopped, in which case a `CANCELLED` status is returned.
// `metrics_callback` is optional.
inline absl::Status RetryUntilOk(
    std::function<absl::Status()> func, std::string task_name,
    const MetricsCallback& metrics_callback, const SleepFor& sleep_for,
    BackoffPolicy backoff_policy = BackoffPolicy()) {
  using Func = std::function<absl::Status()>;
  return RetryableWithMax<Func>(std::move(func), std::move(task_name),
                                RetryableWithMax<Func>::kUnlimitedRetry,
                                metrics_callback, sleep_for, backoff_policy,
                                /*stop_on_permanent_error=*/false)();
}

// Retries functors that return an absl::StatusOr<T> or an absl::Status until
// they are `ok`, `max_attempts` is reached or a non-retryable status comes
// back. Attempts start at 1 and there is no wait after the last one.
// `metrics_callback` is optional.
template <typename Func>
typename std::invoke_result_t<RetryableWithMax<Func>> RetryWithMax(
    Func&& f, std::string task_name, int max_attempts,
    const MetricsCallback& metrics_callback, const SleepFor& sleep_for,
    BackoffPolicy backoff_policy = BackoffPolicy()) {
  return RetryableWithMax<Func>(std::forward<Func>(f), std::move(task_name),
                                max_attempts, metrics_callback, sleep_for,
                                backoff_policy,
                                /*stop_on_permanent_error=*/true)();
}

}  // namespace telemetry_relay

#endif  // COMPONENTS_ERRORS_RETRY_H_
