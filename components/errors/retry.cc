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

#include "components/errors/retry.h"

#include <algorithm>
#include <cmath>

namespace telemetry_relay {

absl::Duration ExponentialBackoffForRetry(uint32_t retries,
                                          const BackoffPolicy& policy) {
  const double multiplier = std::max(policy.multiplier, 1.0);
  const double factor = std::pow(multiplier, std::max<int64_t>(retries, 1) - 1);
  const absl::Duration backoff = policy.initial_backoff * factor;
  return std::min(backoff, policy.max_backoff);
}

bool IsRetryableStatus(const absl::Status& status) {
  switch (status.code()) {
    case absl::StatusCode::kUnavailable:
    case absl::StatusCode::kDeadlineExceeded:
    case absl::StatusCode::kResourceExhausted:
    case absl::StatusCode::kAborted:
    case absl::StatusCode::kInternal:
      return true;
    default:
      return false;
  }
}

}  // namespace telemetry_relay
