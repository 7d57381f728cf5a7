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

#ifndef COMPONENTS_CONFIG_CONFIG_STORE_H_
#define COMPONENTS_CONFIG_CONFIG_STORE_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "components/config/pipeline_config.h"

namespace telemetry_relay {

// Holds the active pipeline configuration. Readers take a snapshot with
// `Get()` and keep using it for the whole unit of work; a concurrent reload
// never changes a snapshot that is already handed out.
class ConfigStore {
 public:
  // `initial` must already be valid.
  explicit ConfigStore(PipelineConfig initial, std::string path = "");

  ConfigStore(const ConfigStore&) = delete;
  ConfigStore& operator=(const ConfigStore&) = delete;

  std::shared_ptr<const PipelineConfig> Get() const;

  // Swaps in `candidate` if it is valid and keeps the active topology.
  // Otherwise returns why and keeps the current snapshot.
  absl::Status Update(PipelineConfig candidate);

  // Re-reads the file the store was created from and calls `Update`.
  absl::Status Reload();

  // Number of successful updates.
  uint64_t generation() const;

 private:
  const std::string path_;
  mutable absl::Mutex mutex_;
  std::shared_ptr<const PipelineConfig> active_ ABSL_GUARDED_BY(mutex_);
  uint64_t generation_ ABSL_GUARDED_BY(mutex_) = 0;
  // Serializes updates so validation runs against the snapshot it replaces.
  absl::Mutex update_mutex_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_CONFIG_CONFIG_STORE_H_
