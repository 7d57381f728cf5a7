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

#ifndef COMPONENTS_HEALTH_HEALTH_SERVICE_H_
#define COMPONENTS_HEALTH_HEALTH_SERVICE_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "components/config/config_store.h"
#include "components/health/health_reporter.h"
#include "components/http/http_server.h"
#include "components/pipeline/memory_limiter.h"
#include "components/pipeline/relay_stats.h"

namespace telemetry_relay {

// Operator facing listener: readiness and liveness probes, self metrics and
// configuration reload.
class HealthService {
 public:
  HealthService(const HealthReporter& reporter, const RelayStats& stats,
                std::vector<const MemoryLimiter*> limiters,
                ConfigStore& config_store);

  absl::Status Start(absl::string_view endpoint);
  void Stop() { server_.Stop(); }
  uint16_t port() const { return server_.port(); }

  HttpResponse Handle(const HttpRequest& request);

 private:
  HttpResponse Ready() const;
  HttpResponse SelfMetrics() const;
  HttpResponse Reload();

  const HealthReporter& reporter_;
  const RelayStats& stats_;
  const std::vector<const MemoryLimiter*> limiters_;
  ConfigStore& config_store_;
  HttpServer server_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_HEALTH_HEALTH_SERVICE_H_
