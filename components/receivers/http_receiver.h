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

#ifndef COMPONENTS_RECEIVERS_HTTP_RECEIVER_H_
#define COMPONENTS_RECEIVERS_HTTP_RECEIVER_H_

#include <string>

#include "absl/status/status.h"
#include "components/config/pipeline_config.h"
#include "components/http/http_server.h"
#include "components/receivers/ingest_handler.h"
#include "components/receivers/receiver.h"

namespace telemetry_relay {

// Maps the result of an ingestion to an HTTP response: 200 with the JSON
// `ExportResponse`, 400 for malformed input or records no pipeline takes,
// 429 with `Retry-After` on backpressure, 503 while shutting down.
HttpResponse IngestResultToHttp(
    const absl::StatusOr<v1::ExportResponse>& result);

// Serves `POST /v1/traces`, `POST /v1/metrics` and `POST /v1/export` with
// protobuf or JSON encoded `ExportRequest` bodies.
class HttpReceiver : public Receiver {
 public:
  HttpReceiver(ReceiverConfig config, IngestHandler& handler);

  absl::Status Start() override;
  void Stop() override { server_.Stop(); }
  bool IsListening() const override { return server_.IsListening(); }
  uint16_t port() const override { return server_.port(); }
  const std::string& name() const override { return config_.name(); }

  // Request handler of the listener, exposed for tests.
  HttpResponse Handle(const HttpRequest& request);

 private:
  const ReceiverConfig config_;
  IngestHandler& handler_;
  HttpServer server_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_RECEIVERS_HTTP_RECEIVER_H_
