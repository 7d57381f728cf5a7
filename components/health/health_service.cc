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

#include "components/health/health_service.h"

#include <string>
#include <utility>

#include "absl/log/log.h"
#include "components/health/self_metrics.h"
#include "nlohmann/json.hpp"
#include "prometheus/text_serializer.h"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

HttpResponse MethodNotAllowed(absl::string_view allow) {
  HttpResponse response = TextResponse(405, "Method Not Allowed\n");
  response.headers.emplace_back("Allow", std::string(allow));
  return response;
}

}  // namespace

HealthService::HealthService(const HealthReporter& reporter,
                             const RelayStats& stats,
                             std::vector<const MemoryLimiter*> limiters,
                             ConfigStore& config_store)
    : reporter_(reporter),
      stats_(stats),
      limiters_(std::move(limiters)),
      config_store_(config_store),
      server_("health",
              [this](const HttpRequest& request) { return Handle(request); }) {}

absl::Status HealthService::Start(absl::string_view endpoint) {
  if (absl::Status status = server_.Start(endpoint); !status.ok()) {
    return status;
  }
  LOG(INFO) << "Health service listening on port " << server_.port();
  return absl::OkStatus();
}

HttpResponse HealthService::Handle(const HttpRequest& request) {
  if (request.path == kReloadPath) {
    return request.method == "POST" ? Reload() : MethodNotAllowed("POST");
  }
  if (request.path != kReadyPath && request.path != kLivePath &&
      request.path != kSelfMetricsPath) {
    return TextResponse(404, "Not Found\n");
  }
  if (request.method != "GET") {
    return MethodNotAllowed("GET");
  }
  if (request.path == kReadyPath) {
    return Ready();
  }
  if (request.path == kLivePath) {
    return JsonResponse(200, nlohmann::json({{"status", "live"}}).dump());
  }
  return SelfMetrics();
}

HttpResponse HealthService::Ready() const {
  const Readiness readiness = reporter_.GetReadiness();
  nlohmann::json body = {
      {"status", readiness.ready ? "ready" : "not_ready"},
      {"reasons", readiness.reasons},
      {"config_generation", config_store_.generation()},
  };
  return JsonResponse(readiness.ready ? 200 : 503, body.dump());
}

HttpResponse HealthService::SelfMetrics() const {
  HttpResponse response;
  response.content_type = std::string(kContentTypeExposition);
  response.body = prometheus::TextSerializer().Serialize(CollectSelfMetrics(
      stats_.Snapshot(), limiters_, reporter_.GetReadiness().ready));
  return response;
}

HttpResponse HealthService::Reload() {
  const absl::Status status = config_store_.Reload();
  if (!status.ok()) {
    LOG(WARNING) << "Config reload rejected: " << status;
    nlohmann::json body = {{"status", "rejected"},
                           {"error", std::string(status.message())}};
    const bool client_error =
        absl::IsInvalidArgument(status) ||
        absl::IsFailedPrecondition(status) || absl::IsNotFound(status);
    return JsonResponse(client_error ? 400 : 500, body.dump());
  }
  nlohmann::json body = {{"status", "reloaded"},
                         {"config_generation", config_store_.generation()}};
  return JsonResponse(200, body.dump());
}

}  // namespace telemetry_relay
