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

#ifndef COMPONENTS_EXPORTERS_EXPORTER_H_
#define COMPONENTS_EXPORTERS_EXPORTER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "components/data/telemetry_batch.h"
#include "components/pipeline/memory_limiter.h"
#include "public/config/v1/pipeline_config.pb.h"

namespace telemetry_relay {

// Delivers batches to one external destination.
class Exporter {
 public:
  virtual ~Exporter() = default;

  // One delivery attempt. Failures are classified with `IsRetryableStatus`.
  virtual absl::Status Export(const TelemetryBatch& batch) = 0;

  // Whether the destination can currently be reached.
  virtual absl::Status CheckConnectivity() = 0;

  // Acquires what the exporter serves from, such as a listening socket.
  virtual absl::Status Start() { return absl::OkStatus(); }

  virtual void Shutdown() {}

  // Port the exporter serves on once started, 0 for push exporters.
  virtual uint16_t port() const { return 0; }
};

// Current settings of one exporter; consulted per batch so that reloaded
// tunables apply to the next delivery.
using ExporterSettingsProvider = std::function<config::v1::ExporterConfig()>;

// A batch shared read-only by every destination of a pipeline. The memory it
// was admitted with stays reserved until the last destination lets go.
struct ExportJob {
  TelemetryBatchPtr batch;
  std::vector<ReservationPtr> reservations;
};

using ExportJobPtr = std::shared_ptr<const ExportJob>;

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_EXPORTER_H_
