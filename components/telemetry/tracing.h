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

#ifndef COMPONENTS_TELEMETRY_TRACING_H_
#define COMPONENTS_TELEMETRY_TRACING_H_

#include <functional>
#include <string>
#include <type_traits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "components/telemetry/telemetry.h"
#include "opentelemetry/common/attribute_value.h"
#include "opentelemetry/nostd/string_view.h"
#include "opentelemetry/trace/scope.h"
#include "opentelemetry/trace/span.h"

namespace telemetry_relay {

// Marks `span` as ok or failed. A failed span carries `status` as its
// description.
void SetStatus(const absl::Status& status, opentelemetry::trace::Span& span);

// Span attribute, e.g. {"receiver", "otlp-grpc"}. The value must outlive the
// traced call.
struct TelemetryAttribute {
  std::string label;
  opentelemetry::common::AttributeValue value;
};

// Runs `func` inside a span called `name` and returns its status.
absl::Status TraceWithStatus(std::function<absl::Status()> func,
                             opentelemetry::nostd::string_view name,
                             std::vector<TelemetryAttribute> attributes = {});

template <typename Func>
typename std::invoke_result_t<Func> TraceWithStatusOr(
    Func&& func, opentelemetry::nostd::string_view name,
    std::vector<TelemetryAttribute> attributes = {}) {
  auto span = GetTracer()->StartSpan(name);
  opentelemetry::trace::Scope scope(span);
  for (const auto& attribute : attributes) {
    span->SetAttribute(attribute.label, attribute.value);
  }
  auto result = func();
  SetStatus(result.status(), *span);
  span->End();
  return result;
}

}  // namespace telemetry_relay

#endif  // COMPONENTS_TELEMETRY_TRACING_H_
