/*
 * Copyright 2022 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef COMPONENTS_UTIL_PERIODIC_CLOSURE_H_
#define COMPONENTS_UTIL_PERIODIC_CLOSURE_H_

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/time/time.h"

namespace telemetry_relay {

// Runs a closure repeatedly on a thread owned by this class. Used for the
// housekeeping loops of the relay: stats logging and the expiry of scraped
// series. Can only be started once.
class PeriodicClosure {
 public:
  // Consulted before every wait, so the period follows reloaded settings.
  using IntervalProvider = std::function<absl::Duration()>;

  virtual ~PeriodicClosure() = default;

  // Executes `closure` after each wait of `interval()`, with no immediate
  // call. Non-positive intervals are treated as one millisecond.
  virtual absl::Status StartDelayed(IntervalProvider interval,
                                    std::function<void()> closure) = 0;

  absl::Status StartDelayed(absl::Duration interval,
                            std::function<void()> closure) {
    return StartDelayed([interval] { return interval; }, std::move(closure));
  }

  // Blocks until an in-progress run of the closure returns.
  virtual void Stop() = 0;

  // `task_name` only shows up in logs.
  static std::unique_ptr<PeriodicClosure> Create(
      std::string task_name = "periodic closure");
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_UTIL_PERIODIC_CLOSURE_H_
