/*
 * Copyright 2022 Google LLC
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

#include "components/util/build_info.h"

#include "absl/log/log.h"

// Stamped by the build system.
#ifndef TELEMETRY_RELAY_BUILD_VERSION
#define TELEMETRY_RELAY_BUILD_VERSION "0.0.0-dev"
#endif
#ifndef TELEMETRY_RELAY_BUILD_FLAVOR
#define TELEMETRY_RELAY_BUILD_FLAVOR "unknown"
#endif
#ifndef TELEMETRY_RELAY_BUILD_PLATFORM
#define TELEMETRY_RELAY_BUILD_PLATFORM "unknown"
#endif

namespace telemetry_relay {

void LogBuildInfo() {
  LOG(INFO) << "Build platform: " << BuildPlatform() << "\n"
            << "Build flavor: " << BuildFlavor() << "\n"
            << "Build version: " << BuildVersion();
}

std::string_view BuildFlavor() { return TELEMETRY_RELAY_BUILD_FLAVOR; }

std::string_view BuildPlatform() { return TELEMETRY_RELAY_BUILD_PLATFORM; }

std::string_view BuildVersion() { return TELEMETRY_RELAY_BUILD_VERSION; }

}  // namespace telemetry_relay
