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

#include "components/telemetry/telemetry_provider.h"

#include <utility>

#include "opentelemetry/trace/provider.h"

namespace telemetry_relay {

void TelemetryProvider::Init(std::string service_name,
                             std::string build_version) {
  TelemetryProvider& instance = GetInstance();
  instance.service_name_ = std::move(service_name);
  instance.build_version_ = std::move(build_version);
}

TelemetryProvider& TelemetryProvider::GetInstance() {
  // Never destroyed so that detached threads can still report at exit.
  static TelemetryProvider* const instance = new TelemetryProvider();
  return *instance;
}

opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer>
TelemetryProvider::GetTracer() const {
  return opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(
      service_name_, build_version_);
}

}  // namespace telemetry_relay
