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

#ifndef COMPONENTS_RECEIVERS_GRPC_RECEIVER_H_
#define COMPONENTS_RECEIVERS_GRPC_RECEIVER_H_

#include <atomic>
#include <memory>
#include <string>

#include "components/config/pipeline_config.h"
#include "components/receivers/ingest_handler.h"
#include "components/receivers/receiver.h"
#include "grpcpp/grpcpp.h"
#include "public/telemetry/v1/telemetry.grpc.pb.h"

namespace telemetry_relay {

// Implements the ingestion API over gRPC.
class TelemetryIngestServiceImpl final
    : public v1::TelemetryIngestService::CallbackService {
 public:
  explicit TelemetryIngestServiceImpl(IngestHandler& handler)
      : handler_(handler) {}

  grpc::ServerUnaryReactor* Export(grpc::CallbackServerContext* context,
                                   const v1::ExportRequest* request,
                                   v1::ExportResponse* response) override;

 private:
  IngestHandler& handler_;
};

class GrpcReceiver : public Receiver {
 public:
  GrpcReceiver(ReceiverConfig config, IngestHandler& handler);
  ~GrpcReceiver() override;

  absl::Status Start() override;
  void Stop() override;
  bool IsListening() const override { return listening_; }
  uint16_t port() const override { return port_; }
  const std::string& name() const override { return config_.name(); }

 private:
  const ReceiverConfig config_;
  TelemetryIngestServiceImpl service_;
  std::unique_ptr<grpc::Server> server_;
  std::atomic<bool> listening_{false};
  uint16_t port_ = 0;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_RECEIVERS_GRPC_RECEIVER_H_
