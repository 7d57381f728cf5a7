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

#ifndef COMPONENTS_PIPELINE_RELAY_STATS_H_
#define COMPONENTS_PIPELINE_RELAY_STATS_H_

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace telemetry_relay {

// Delivery counters of one exporter.
struct ExporterCounters {
  std::atomic<uint64_t> sent_batches{0};
  std::atomic<uint64_t> sent_records{0};
  // Retries exhausted or rejected by the destination.
  std::atomic<uint64_t> failed_batches{0};
  std::atomic<uint64_t> failed_records{0};
  // Refused because the exporter queue was full.
  std::atomic<uint64_t> dropped_batches{0};
  std::atomic<uint64_t> dropped_records{0};
  // Individual attempts, including the ones that were retried.
  std::atomic<uint64_t> attempts{0};
};

struct ExporterCountersSnapshot {
  uint64_t sent_batches = 0;
  uint64_t sent_records = 0;
  uint64_t failed_batches = 0;
  uint64_t failed_records = 0;
  uint64_t dropped_batches = 0;
  uint64_t dropped_records = 0;
  uint64_t attempts = 0;
};

struct RelayStatsSnapshot {
  uint64_t accepted_records = 0;
  uint64_t rejected_requests = 0;
  uint64_t refused_records = 0;
  uint64_t evicted_records = 0;
  uint64_t unrouted_records = 0;
  uint64_t shutdown_dropped_records = 0;
  std::map<std::string, ExporterCountersSnapshot> exporters;
};

// Process-wide counters of everything the relay accepted or discarded,
// surfaced on the self-metrics endpoint and in the periodic stats log.
class RelayStats {
 public:
  RelayStats() = default;
  RelayStats(const RelayStats&) = delete;
  RelayStats& operator=(const RelayStats&) = delete;

  void AddAccepted(uint64_t records) { accepted_records_ += records; }
  // Requests rejected as malformed.
  void AddRejectedRequest() { ++rejected_requests_; }
  // Refused by a memory limiter.
  void AddRefused(uint64_t records) { refused_records_ += records; }
  // Queued records a memory limiter evicted.
  void AddEvicted(uint64_t records) { evicted_records_ += records; }
  // Accepted records no pipeline of their receiver carries.
  void AddUnrouted(uint64_t records) { unrouted_records_ += records; }
  void AddShutdownDropped(uint64_t records) {
    shutdown_dropped_records_ += records;
  }

  // Counters of `exporter`, created on first use. The reference stays valid
  // for the lifetime of this object.
  ExporterCounters& ForExporter(absl::string_view exporter);

  RelayStatsSnapshot Snapshot() const;

 private:
  std::atomic<uint64_t> accepted_records_{0};
  std::atomic<uint64_t> rejected_requests_{0};
  std::atomic<uint64_t> refused_records_{0};
  std::atomic<uint64_t> evicted_records_{0};
  std::atomic<uint64_t> unrouted_records_{0};
  std::atomic<uint64_t> shutdown_dropped_records_{0};
  mutable absl::Mutex mutex_;
  std::map<std::string, std::unique_ptr<ExporterCounters>, std::less<>>
      exporters_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_PIPELINE_RELAY_STATS_H_
