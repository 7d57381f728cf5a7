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

#include "components/util/host_port.h"

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace telemetry_relay {

absl::StatusOr<HostPort> ParseHostPort(absl::string_view endpoint) {
  HostPort result;
  absl::string_view port;
  if (absl::StartsWith(endpoint, "[")) {
    const size_t close = endpoint.find("]:");
    if (close == absl::string_view::npos) {
      return absl::InvalidArgumentError(
          absl::StrCat("endpoint '", endpoint, "' is not [host]:port"));
    }
    result.host = std::string(endpoint.substr(1, close - 1));
    port = endpoint.substr(close + 2);
  } else {
    const size_t colon = endpoint.rfind(':');
    if (colon == absl::string_view::npos) {
      return absl::InvalidArgumentError(
          absl::StrCat("endpoint '", endpoint, "' is not host:port"));
    }
    result.host = std::string(endpoint.substr(0, colon));
    port = endpoint.substr(colon + 1);
  }
  uint32_t port_number = 0;
  if (!absl::SimpleAtoi(port, &port_number) || port_number > 65535) {
    return absl::InvalidArgumentError(
        absl::StrCat("endpoint '", endpoint, "' has an invalid port"));
  }
  result.port = static_cast<uint16_t>(port_number);
  return result;
}

}  // namespace telemetry_relay
