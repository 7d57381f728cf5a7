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

#include "components/pipeline/relay_stats.h"

namespace telemetry_relay {

ExporterCounters& RelayStats::ForExporter(absl::string_view exporter) {
  absl::MutexLock lock(&mutex_);
  auto it = exporters_.find(exporter);
  if (it == exporters_.end()) {
    it = exporters_
             .emplace(std::string(exporter),
                      std::make_unique<ExporterCounters>())
             .first;
  }
  return *it->second;
}

RelayStatsSnapshot RelayStats::Snapshot() const {
  RelayStatsSnapshot snapshot;
  snapshot.accepted_records = accepted_records_;
  snapshot.rejected_requests = rejected_requests_;
  snapshot.refused_records = refused_records_;
  snapshot.evicted_records = evicted_records_;
  snapshot.unrouted_records = unrouted_records_;
  snapshot.shutdown_dropped_records = shutdown_dropped_records_;
  absl::ReaderMutexLock lock(&mutex_);
  for (const auto& [name, counters] : exporters_) {
    ExporterCountersSnapshot& out = snapshot.exporters[name];
    out.sent_batches = counters->sent_batches;
    out.sent_records = counters->sent_records;
    out.failed_batches = counters->failed_batches;
    out.failed_records = counters->failed_records;
    out.dropped_batches = counters->dropped_batches;
    out.dropped_records = counters->dropped_records;
    out.attempts = counters->attempts;
  }
  return snapshot;
}

}  // namespace telemetry_relay
