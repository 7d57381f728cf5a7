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

#include "components/exporters/logging_exporter.h"

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace telemetry_relay {

std::string SummarizeBatch(const TelemetryBatch& batch) {
  return absl::StrCat(batch.size(), " records (",
                      batch.CountSignal(Signal::kTraces), " spans, ",
                      batch.CountSignal(Signal::kMetrics), " metric points)");
}

absl::Status LoggingExporter::Export(const TelemetryBatch& batch) {
  LOG(INFO) << name_ << ": " << SummarizeBatch(batch);
  if (VLOG_IS_ON(1)) {
    for (const v1::Record& record : batch.records()) {
      LOG(INFO) << name_ << ": " << record.ShortDebugString();
    }
  }
  return absl::OkStatus();
}

}  // namespace telemetry_relay
