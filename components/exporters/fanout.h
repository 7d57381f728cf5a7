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

#ifndef COMPONENTS_EXPORTERS_FANOUT_H_
#define COMPONENTS_EXPORTERS_FANOUT_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "components/data/telemetry_batch.h"
#include "components/exporters/exporter_worker.h"

namespace telemetry_relay {

// Hands each finished batch of a pipeline to all of its destinations. The
// batch is frozen and shared; no destination can observe another's work.
class Fanout {
 public:
  explicit Fanout(std::vector<ExporterWorker*> workers)
      : workers_(std::move(workers)) {}

  // Returns the number of destinations that queued the batch.
  size_t Dispatch(TelemetryBatch batch,
                  std::vector<ReservationPtr> reservations) const;

  const std::vector<ExporterWorker*>& workers() const { return workers_; }

 private:
  std::vector<ExporterWorker*> workers_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_FANOUT_H_
