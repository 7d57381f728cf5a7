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

#include "components/exporters/fanout.h"

#include <memory>

namespace telemetry_relay {

size_t Fanout::Dispatch(TelemetryBatch batch,
                        std::vector<ReservationPtr> reservations) const {
  if (batch.empty()) {
    return 0;
  }
  auto job = std::make_shared<ExportJob>();
  job->batch = std::make_shared<const TelemetryBatch>(std::move(batch));
  job->reservations = std::move(reservations);
  const ExportJobPtr shared = std::move(job);
  size_t queued = 0;
  for (ExporterWorker* worker : workers_) {
    queued += worker->Enqueue(shared) ? 1 : 0;
  }
  return queued;
}

}  // namespace telemetry_relay
