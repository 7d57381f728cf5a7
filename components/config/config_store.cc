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

#include "components/config/config_store.h"

#include <utility>

#include "absl/log/log.h"

namespace telemetry_relay {

ConfigStore::ConfigStore(PipelineConfig initial, std::string path)
    : path_(std::move(path)),
      active_(std::make_shared<const PipelineConfig>(std::move(initial))) {}

std::shared_ptr<const PipelineConfig> ConfigStore::Get() const {
  absl::ReaderMutexLock lock(&mutex_);
  return active_;
}

absl::Status ConfigStore::Update(PipelineConfig candidate) {
  absl::MutexLock update_lock(&update_mutex_);
  if (absl::Status status = ValidatePipelineConfig(candidate); !status.ok()) {
    return status;
  }
  if (absl::Status status = CheckSameTopology(*Get(), candidate);
      !status.ok()) {
    return status;
  }
  auto next = std::make_shared<const PipelineConfig>(std::move(candidate));
  absl::MutexLock lock(&mutex_);
  active_ = std::move(next);
  ++generation_;
  LOG(INFO) << "Pipeline config updated to generation " << generation_;
  return absl::OkStatus();
}

absl::Status ConfigStore::Reload() {
  if (path_.empty()) {
    return absl::FailedPreconditionError(
        "config store was not created from a file");
  }
  absl::StatusOr<PipelineConfig> candidate = LoadPipelineConfig(path_);
  if (!candidate.ok()) {
    return candidate.status();
  }
  return Update(*std::move(candidate));
}

uint64_t ConfigStore::generation() const {
  absl::ReaderMutexLock lock(&mutex_);
  return generation_;
}

}  // namespace telemetry_relay
