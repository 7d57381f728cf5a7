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

#ifndef COMPONENTS_EXPORTERS_GRPC_EXPORTER_H_
#define COMPONENTS_EXPORTERS_GRPC_EXPORTER_H_

#include <memory>

#include "components/exporters/exporter.h"
#include "grpcpp/grpcpp.h"
#include "public/telemetry/v1/telemetry.grpc.pb.h"

namespace telemetry_relay {

// Calls `TelemetryIngestService.Export` on a downstream relay.
class GrpcExporter : public Exporter {
 public:
  GrpcExporter(ExporterSettingsProvider settings,
               std::shared_ptr<grpc::Channel> channel);

  // Plaintext channel to the exporter's `endpoint`.
  static std::unique_ptr<GrpcExporter> Create(
      ExporterSettingsProvider settings);

  absl::Status Export(const TelemetryBatch& batch) override;

  // Succeeds once the channel is READY, trying to connect for at most the
  // export timeout.
  absl::Status CheckConnectivity() override;

 private:
  const ExporterSettingsProvider settings_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<v1::TelemetryIngestService::Stub> stub_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_GRPC_EXPORTER_H_
