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

#include "components/receivers/grpc_receiver.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"
#include "components/errors/grpc_status.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kBindFailed = 1,
};

}  // namespace

grpc::ServerUnaryReactor* TelemetryIngestServiceImpl::Export(
    grpc::CallbackServerContext* context, const v1::ExportRequest* request,
    v1::ExportResponse* response) {
  absl::StatusOr<v1::ExportResponse> result = handler_.Handle(*request);
  grpc::Status status;
  if (result.ok()) {
    *response = *std::move(result);
  } else {
    status = FromAbslStatus(result.status());
  }
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

GrpcReceiver::GrpcReceiver(ReceiverConfig config, IngestHandler& handler)
    : config_(std::move(config)), service_(handler) {}

GrpcReceiver::~GrpcReceiver() { Stop(); }

absl::Status GrpcReceiver::Start() {
  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(config_.endpoint(),
                           grpc::InsecureServerCredentials(), &selected_port);
  builder.SetMaxReceiveMessageSize(
      static_cast<int>(GetMaxRequestBytes(config_)));
  builder.RegisterService(&service_);
  server_ = builder.BuildAndStart();
  if (server_ == nullptr || selected_port == 0) {
    server_.reset();
    return StatusWithErrorTag(
        absl::UnavailableError(absl::StrCat("gRPC receiver ", config_.name(),
                                            " cannot bind ",
                                            config_.endpoint())),
        __FILE__, ErrorTag::kBindFailed);
  }
  port_ = static_cast<uint16_t>(selected_port);
  listening_ = true;
  LOG(INFO) << "gRPC receiver " << config_.name() << " listening on port "
            << port_;
  return absl::OkStatus();
}

void GrpcReceiver::Stop() {
  if (server_ == nullptr) {
    return;
  }
  listening_ = false;
  server_->Shutdown();
  server_->Wait();
  server_.reset();
  LOG(INFO) << "gRPC receiver " << config_.name() << " stopped";
}

}  // namespace telemetry_relay
