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

#ifndef COMPONENTS_RECEIVERS_INGEST_HANDLER_H_
#define COMPONENTS_RECEIVERS_INGEST_HANDLER_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "components/data/telemetry_batch.h"
#include "components/pipeline/relay_stats.h"
#include "components/pipeline/router.h"
#include "components/telemetry/metrics_recorder.h"
#include "public/telemetry/v1/telemetry.pb.h"

namespace telemetry_relay {

// Protocol independent part of a receiver: validates a decoded request and
// submits it to the pipelines of the receiver.
class IngestHandler {
 public:
  IngestHandler(std::string receiver, Router& router, RelayStats& stats,
                MetricsRecorder& metrics_recorder)
      : receiver_(std::move(receiver)),
        router_(router),
        stats_(stats),
        metrics_recorder_(metrics_recorder) {}

  // With `only` set, records of the other signal reject the request.
  // Errors:
  //  - INVALID_ARGUMENT for malformed records;
  //  - RESOURCE_EXHAUSTED, FAILED_PRECONDITION, UNAVAILABLE from the router.
  absl::StatusOr<v1::ExportResponse> Handle(
      v1::ExportRequest request, absl::optional<Signal> only = absl::nullopt);

  // Accounts a request that failed to decode before reaching `Handle`.
  void CountRejected(const absl::Status& status);

  const std::string& receiver() const { return receiver_; }

 private:
  absl::StatusOr<uint64_t> Submit(v1::ExportRequest request,
                                  absl::optional<Signal> only);

  const std::string receiver_;
  Router& router_;
  RelayStats& stats_;
  MetricsRecorder& metrics_recorder_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_RECEIVERS_INGEST_HANDLER_H_
