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

#include "components/pipeline/resource_processor.h"

#include <utility>
#include <vector>

namespace telemetry_relay {

TelemetryBatch ResourceProcessor::Process(TelemetryBatch batch) const {
  const config::v1::ResourceConfig settings = settings_();
  if (settings.attributes().empty()) {
    return batch;
  }
  std::vector<v1::Record> records = std::move(batch).ReleaseRecords();
  for (v1::Record& record : records) {
    auto& resource = *record.mutable_resource();
    for (const auto& [key, value] : settings.attributes()) {
      if (!settings.overwrite() && resource.find(key) != resource.end()) {
        continue;
      }
      resource[key].set_string_value(value);
    }
  }
  return TelemetryBatch(std::move(records));
}

}  // namespace telemetry_relay
