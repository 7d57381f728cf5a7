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

#include "components/receivers/ingest_handler.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kWrongSignal = 1,
};

}  // namespace

absl::StatusOr<v1::ExportResponse> IngestHandler::Handle(
    v1::ExportRequest request, absl::optional<Signal> only) {
  ScopeLatencyRecorder latency(absl::StrCat("ingest.", receiver_),
                               metrics_recorder_);
  const absl::StatusOr<uint64_t> accepted = Submit(std::move(request), only);
  metrics_recorder_.IncrementEventStatus(absl::StrCat("ingest.", receiver_),
                                         accepted.status());
  if (!accepted.ok()) {
    VLOG(1) << "Receiver " << receiver_ << " rejected a request: "
            << accepted.status();
    return accepted.status();
  }
  v1::ExportResponse response;
  response.set_accepted_records(*accepted);
  return response;
}

void IngestHandler::CountRejected(const absl::Status& status) {
  stats_.AddRejectedRequest();
  metrics_recorder_.IncrementEventStatus(absl::StrCat("ingest.", receiver_),
                                         status);
}

absl::StatusOr<uint64_t> IngestHandler::Submit(v1::ExportRequest request,
                                               absl::optional<Signal> only) {
  absl::StatusOr<TelemetryBatch> batch =
      TelemetryBatch::FromRequest(std::move(request));
  if (!batch.ok()) {
    stats_.AddRejectedRequest();
    return batch.status();
  }
  if (only.has_value() && batch->CountSignal(*only) != batch->size()) {
    stats_.AddRejectedRequest();
    return StatusWithErrorTag(
        absl::InvalidArgumentError(absl::StrCat(
            "request carries records other than ", SignalName(*only))),
        __FILE__, ErrorTag::kWrongSignal);
  }
  return router_.Submit(receiver_, *std::move(batch));
}

}  // namespace telemetry_relay
