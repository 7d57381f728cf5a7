/*
 * Copyright 2024 Google LLC
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

#ifndef COMPONENTS_PIPELINE_ROUTER_H_
#define COMPONENTS_PIPELINE_ROUTER_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "components/data/telemetry_batch.h"
#include "components/pipeline/pipeline.h"
#include "components/pipeline/relay_stats.h"

namespace telemetry_relay {

// Thread-safe entry point of the processing side: hands batches decoded by a
// receiver to every pipeline wired to that receiver.
//
// A batch is accepted or refused as a whole. Each pipeline first admits its
// share of the records; if any memory limiter refuses, every reservation is
// released and nothing is queued.
class Router {
 public:
  explicit Router(RelayStats& stats) : stats_(stats) {}

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  // Wiring happens before any receiver starts.
  void AddRoute(absl::string_view receiver, Pipeline* pipeline);

  // Returns the number of records queued. Errors:
  //  - UNAVAILABLE once `StopAccepting` was called;
  //  - RESOURCE_EXHAUSTED when a memory limiter refuses the batch;
  //  - FAILED_PRECONDITION when no pipeline of `receiver` carries any of the
  //    records.
  // Records of a signal the receiver has no pipeline for are counted as
  // unrouted.
  absl::StatusOr<uint64_t> Submit(absl::string_view receiver,
                                  TelemetryBatch batch);

  void StopAccepting() { accepting_ = false; }
  bool accepting() const { return accepting_; }

 private:
  RelayStats& stats_;
  absl::flat_hash_map<std::string, std::vector<Pipeline*>> routes_;
  std::atomic<bool> accepting_{true};
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_ROUTER_H_
