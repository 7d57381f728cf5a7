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

#include "components/pipeline/router.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kShuttingDown = 1,
  kNoPipeline = 2,
};

}  // namespace

void Router::AddRoute(absl::string_view receiver, Pipeline* pipeline) {
  routes_[std::string(receiver)].push_back(pipeline);
}

absl::StatusOr<uint64_t> Router::Submit(absl::string_view receiver,
                                        TelemetryBatch batch) {
  if (!accepting_) {
    return StatusWithErrorTag(absl::UnavailableError("relay is shutting down"),
                              __FILE__, ErrorTag::kShuttingDown);
  }
  if (batch.empty()) {
    return 0;
  }
  const auto route = routes_.find(receiver);
  std::vector<std::pair<Pipeline*, PipelineBatch>> admitted;
  bool carries_traces = false;
  bool carries_metrics = false;
  if (route != routes_.end()) {
    for (Pipeline* pipeline : route->second) {
      TelemetryBatch share = batch.FilterSignal(pipeline->signal());
      if (share.empty()) {
        continue;
      }
      // Dropping `admitted` on refusal releases the earlier reservations.
      absl::StatusOr<PipelineBatch> pipeline_batch =
          pipeline->Admit(std::move(share));
      if (!pipeline_batch.ok()) {
        return pipeline_batch.status();
      }
      admitted.emplace_back(pipeline, *std::move(pipeline_batch));
      if (pipeline->signal() == Signal::kTraces) {
        carries_traces = true;
      } else {
        carries_metrics = true;
      }
    }
  }
  if (admitted.empty()) {
    stats_.AddUnrouted(batch.size());
    return StatusWithErrorTag(
        absl::FailedPreconditionError(absl::StrCat(
            "no pipeline of receiver ", receiver, " accepts these records")),
        __FILE__, ErrorTag::kNoPipeline);
  }
  const uint64_t routed =
      (carries_traces ? batch.CountSignal(Signal::kTraces) : 0) +
      (carries_metrics ? batch.CountSignal(Signal::kMetrics) : 0);
  for (auto& [pipeline, pipeline_batch] : admitted) {
    pipeline->Enqueue(std::move(pipeline_batch));
  }
  stats_.AddAccepted(routed);
  if (routed < batch.size()) {
    stats_.AddUnrouted(batch.size() - routed);
  }
  return routed;
}

}  // namespace telemetry_relay
