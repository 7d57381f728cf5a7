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

#include "components/exporters/grpc_exporter.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "components/config/pipeline_config.h"
#include "components/errors/grpc_status.h"

namespace telemetry_relay {

GrpcExporter::GrpcExporter(ExporterSettingsProvider settings,
                           std::shared_ptr<grpc::Channel> channel)
    : settings_(std::move(settings)),
      channel_(std::move(channel)),
      stub_(v1::TelemetryIngestService::NewStub(channel_)) {}

std::unique_ptr<GrpcExporter> GrpcExporter::Create(
    ExporterSettingsProvider settings) {
  const ExporterConfig config = settings();
  return std::make_unique<GrpcExporter>(
      std::move(settings),
      grpc::CreateChannel(config.endpoint(),
                          grpc::InsecureChannelCredentials()));
}

absl::Status GrpcExporter::Export(const TelemetryBatch& batch) {
  if (batch.empty()) {
    return absl::OkStatus();
  }
  const ExporterConfig settings = settings_();
  grpc::ClientContext context;
  context.set_deadline(
      absl::ToChronoTime(absl::Now() + GetExportTimeout(settings)));
  v1::ExportResponse response;
  const grpc::Status status =
      stub_->Export(&context, batch.ToRequest(), &response);
  if (!status.ok()) {
    VLOG(2) << "Export to " << settings.endpoint() << " failed: "
            << status.error_code() << ": " << status.error_message();
  }
  return ToAbslStatus(status);
}

absl::Status GrpcExporter::CheckConnectivity() {
  const absl::Time deadline = absl::Now() + GetExportTimeout(settings_());
  grpc_connectivity_state state = channel_->GetState(/*try_to_connect=*/true);
  while (state != GRPC_CHANNEL_READY) {
    if (!channel_->WaitForStateChange(state, absl::ToChronoTime(deadline))) {
      return absl::UnavailableError(absl::StrCat(
          "Channel not ready, last state ", static_cast<int>(state)));
    }
    state = channel_->GetState(/*try_to_connect=*/true);
  }
  return absl::OkStatus();
}

}  // namespace telemetry_relay
