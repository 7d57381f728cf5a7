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

#ifndef COMPONENTS_EXPORTERS_LOGGING_EXPORTER_H_
#define COMPONENTS_EXPORTERS_LOGGING_EXPORTER_H_

#include <string>
#include <utility>

#include "components/exporters/exporter.h"

namespace telemetry_relay {

// Logs one line per batch, and every record at --v=1 or above.
class LoggingExporter : public Exporter {
 public:
  explicit LoggingExporter(std::string name) : name_(std::move(name)) {}

  absl::Status Export(const TelemetryBatch& batch) override;
  absl::Status CheckConnectivity() override { return absl::OkStatus(); }

 private:
  const std::string name_;
};

// One line summary, e.g. "3 records (2 spans, 1 metric points)".
std::string SummarizeBatch(const TelemetryBatch& batch);

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_LOGGING_EXPORTER_H_
