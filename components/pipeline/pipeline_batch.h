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

#ifndef COMPONENTS_PIPELINE_PIPELINE_BATCH_H_
#define COMPONENTS_PIPELINE_PIPELINE_BATCH_H_

#include <vector>

#include "absl/time/time.h"
#include "components/data/telemetry_batch.h"
#include "components/pipeline/memory_limiter.h"

namespace telemetry_relay {

// A batch moving through a pipeline together with the memory reservations of
// the admitted batches its records came from.
struct PipelineBatch {
  TelemetryBatch batch;
  std::vector<ReservationPtr> reservations;
  absl::Time enqueued_at = absl::InfinitePast();
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_PIPELINE_BATCH_H_
