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

#ifndef PUBLIC_CONSTANTS_H_
#define PUBLIC_CONSTANTS_H_

#include <cstdint>
#include "absl/strings/string_view.h"

namespace telemetry_relay {

// Name reported in self-telemetry and logs.
constexpr absl::string_view kServiceName = "telemetry-relay";

// HTTP ingestion paths. `kExportPath` accepts both signals.
constexpr absl::string_view kTracesPath = "/v1/traces";
constexpr absl::string_view kMetricsPath = "/v1/metrics";
constexpr absl::string_view kExportPath = "/v1/export";

// Health surface paths.
constexpr absl::string_view kReadyPath = "/health/ready";
constexpr absl::string_view kLivePath = "/health/live";
constexpr absl::string_view kSelfMetricsPath = "/metrics";
constexpr absl::string_view kReloadPath = "/-/reload";

// Path served by the Prometheus exporter.
constexpr absl::string_view kExpositionPath = "/metrics";

constexpr absl::string_view kContentTypeJson = "application/json";
constexpr absl::string_view kContentTypeProtobuf = "application/x-protobuf";
// Prometheus text exposition format 0.0.4.
constexpr absl::string_view kContentTypeExposition =
    "text/plain; version=0.0.4; charset=utf-8";

// Upper bound of an ingestion request when a receiver does not set one.
constexpr uint64_t kDefaultMaxRequestBytes = 4 * 1024 * 1024;

}  // namespace telemetry_relay

#endif  // PUBLIC_CONSTANTS_H_
