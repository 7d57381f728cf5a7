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

#ifndef COMPONENTS_UTIL_HOST_PORT_H_
#define COMPONENTS_UTIL_HOST_PORT_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace telemetry_relay {

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

// Parses "host:port" or "[v6addr]:port". An empty host means any address.
absl::StatusOr<HostPort> ParseHostPort(absl::string_view endpoint);

}  // namespace telemetry_relay

#endif  // COMPONENTS_UTIL_HOST_PORT_H_
