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

#include "components/health/self_metrics.h"

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "prometheus/client_metric.h"

namespace telemetry_relay {
namespace {

constexpr absl::string_view kPrefix = "telemetry_relay_";

using Labels = std::vector<prometheus::ClientMetric::Label>;

prometheus::MetricFamily Family(absl::string_view name, absl::string_view help,
                                prometheus::MetricType type) {
  prometheus::MetricFamily family;
  family.name = absl::StrCat(kPrefix, name);
  family.help = std::string(help);
  family.type = type;
  return family;
}

void AddCounter(Labels labels, uint64_t value,
                prometheus::MetricFamily& family) {
  prometheus::ClientMetric metric;
  metric.label = std::move(labels);
  metric.counter.value = static_cast<double>(value);
  family.metric.push_back(std::move(metric));
}

void AddGauge(Labels labels, double value, prometheus::MetricFamily& family) {
  prometheus::ClientMetric metric;
  metric.label = std::move(labels);
  metric.gauge.value = value;
  family.metric.push_back(std::move(metric));
}

prometheus::MetricFamily Counter(absl::string_view name,
                                 absl::string_view help, uint64_t value) {
  prometheus::MetricFamily family =
      Family(name, help, prometheus::MetricType::Counter);
  AddCounter({}, value, family);
  return family;
}

// One family with a sample per exporter.
template <typename Field>
prometheus::MetricFamily ExporterCounter(absl::string_view name,
                                         absl::string_view help,
                                         const RelayStatsSnapshot& stats,
                                         Field field) {
  prometheus::MetricFamily family = Family(absl::StrCat("exporter_", name),
                                           help,
                                           prometheus::MetricType::Counter);
  for (const auto& [exporter, counters] : stats.exporters) {
    AddCounter({{"exporter", exporter}}, counters.*field, family);
  }
  return family;
}

void CollectLimiterGauges(const std::vector<const MemoryLimiter*>& limiters,
                          std::vector<prometheus::MetricFamily>& out) {
  prometheus::MetricFamily usage =
      Family("memory_limiter_usage_bytes", "Bytes held by admitted batches.",
             prometheus::MetricType::Gauge);
  prometheus::MetricFamily peak =
      Family("memory_limiter_peak_usage_bytes", "Highest usage since start.",
             prometheus::MetricType::Gauge);
  prometheus::MetricFamily limit =
      Family("memory_limiter_limit_bytes", "Configured soft and hard limits.",
             prometheus::MetricType::Gauge);
  // State set: exactly one state per limiter is 1.
  prometheus::MetricFamily state =
      Family("memory_limiter_state", "", prometheus::MetricType::Gauge);
  for (const MemoryLimiter* limiter : limiters) {
    AddGauge({{"limiter", limiter->name()}},
             static_cast<double>(limiter->usage_bytes()), usage);
    AddGauge({{"limiter", limiter->name()}},
             static_cast<double>(limiter->peak_usage_bytes()), peak);
    const MemoryLimits limits = limiter->limits();
    AddGauge({{"limiter", limiter->name()}, {"limit", "soft"}},
             static_cast<double>(limits.soft_bytes), limit);
    AddGauge({{"limiter", limiter->name()}, {"limit", "hard"}},
             static_cast<double>(limits.hard_bytes), limit);
    const LimiterState current = limiter->state();
    for (LimiterState candidate :
         {LimiterState::kNormal, LimiterState::kSoftLimited,
          LimiterState::kHardLimited}) {
      AddGauge({{"limiter", limiter->name()},
                {"state", std::string(LimiterStateName(candidate))}},
               candidate == current ? 1 : 0, state);
    }
  }
  out.push_back(std::move(usage));
  out.push_back(std::move(peak));
  out.push_back(std::move(limit));
  out.push_back(std::move(state));
}

}  // namespace

std::vector<prometheus::MetricFamily> CollectSelfMetrics(
    const RelayStatsSnapshot& stats,
    const std::vector<const MemoryLimiter*>& limiters, bool ready) {
  std::vector<prometheus::MetricFamily> out;
  prometheus::MetricFamily ready_family =
      Family("ready", "", prometheus::MetricType::Gauge);
  AddGauge({}, ready ? 1 : 0, ready_family);
  out.push_back(std::move(ready_family));

  out.push_back(Counter("accepted_records_total",
                        "Records queued to a pipeline.",
                        stats.accepted_records));
  out.push_back(Counter("rejected_requests_total",
                        "Malformed ingestion requests.",
                        stats.rejected_requests));
  out.push_back(Counter("refused_records_total",
                        "Records refused by backpressure.",
                        stats.refused_records));
  out.push_back(Counter("evicted_records_total",
                        "Queued records dropped to stay under a hard limit.",
                        stats.evicted_records));
  out.push_back(Counter(
      "unrouted_records_total",
      "Records of a signal their receiver has no pipeline for.",
      stats.unrouted_records));
  out.push_back(Counter(
      "shutdown_dropped_records_total",
      "Records not flushed within the shutdown grace period.",
      stats.shutdown_dropped_records));

  out.push_back(ExporterCounter("sent_batches_total", "", stats,
                                &ExporterCountersSnapshot::sent_batches));
  out.push_back(ExporterCounter("sent_records_total", "", stats,
                                &ExporterCountersSnapshot::sent_records));
  out.push_back(ExporterCounter("failed_batches_total",
                                "Batches rejected or out of retries.", stats,
                                &ExporterCountersSnapshot::failed_batches));
  out.push_back(ExporterCounter("failed_records_total", "", stats,
                                &ExporterCountersSnapshot::failed_records));
  out.push_back(ExporterCounter("dropped_batches_total",
                                "Batches dropped on a full exporter queue.",
                                stats,
                                &ExporterCountersSnapshot::dropped_batches));
  out.push_back(ExporterCounter("dropped_records_total", "", stats,
                                &ExporterCountersSnapshot::dropped_records));
  out.push_back(ExporterCounter("attempts_total",
                                "Export attempts, retries included.", stats,
                                &ExporterCountersSnapshot::attempts));

  CollectLimiterGauges(limiters, out);
  return out;
}

}  // namespace telemetry_relay
