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

#ifndef COMPONENTS_PIPELINE_RESOURCE_PROCESSOR_H_
#define COMPONENTS_PIPELINE_RESOURCE_PROCESSOR_H_

#include <functional>
#include <utility>

#include "components/data/telemetry_batch.h"
#include "public/config/v1/pipeline_config.pb.h"

namespace telemetry_relay {

// Attaches static resource attributes, such as the deployment environment,
// to every record of a batch.
class ResourceProcessor {
 public:
  using SettingsProvider = std::function<config::v1::ResourceConfig()>;

  explicit ResourceProcessor(SettingsProvider settings)
      : settings_(std::move(settings)) {}

  // Existing keys are replaced only when the settings ask to overwrite.
  TelemetryBatch Process(TelemetryBatch batch) const;

 private:
  SettingsProvider settings_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_RESOURCE_PROCESSOR_H_
