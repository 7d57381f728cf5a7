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

#ifndef COMPONENTS_EXPORTERS_METRIC_STORE_H_
#define COMPONENTS_EXPORTERS_METRIC_STORE_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "components/data/telemetry_batch.h"
#include "prometheus/collectable.h"
#include "prometheus/metric_family.h"

namespace telemetry_relay {

// Latest state of every metric series pushed through a Prometheus exporter,
// collected on scrape.
//
// Cumulative points replace the stored series; delta counters and delta
// histograms with unchanged bounds are added to it. Gauges always replace.
// Counter families are exposed with a `_total` suffix.
class MetricStore : public prometheus::Collectable {
 public:
  MetricStore() = default;
  MetricStore(const MetricStore&) = delete;
  MetricStore& operator=(const MetricStore&) = delete;

  // Applies the metric points of `batch`; spans are ignored. With
  // `resource_labels`, resource attributes become labels of every series,
  // unless the point has a label of the same name.
  void Update(const TelemetryBatch& batch, bool resource_labels,
              absl::Time now);

  // Drops series last updated before `now - expiration`. Returns how many
  // were dropped.
  size_t Expire(absl::Time now, absl::Duration expiration);

  // Every family and series, sorted by name and labels.
  std::vector<prometheus::MetricFamily> Collect() const override;

  size_t series_count() const;

 private:
  // Sanitized label names to values.
  using SeriesLabels = std::map<std::string, std::string>;

  struct Series {
    double value = 0;
    std::vector<double> bounds;
    std::vector<uint64_t> bucket_counts;
    double sum = 0;
    absl::Time updated;
  };

  struct Family {
    v1::MetricPoint::Kind kind = v1::MetricPoint::KIND_UNSPECIFIED;
    std::string help;
    std::map<SeriesLabels, Series> series;
  };

  void Apply(const v1::MetricPoint& point, SeriesLabels labels,
             absl::Time now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  static prometheus::MetricFamily ToFamily(const std::string& name,
                                           const Family& family);

  mutable absl::Mutex mutex_;
  std::map<std::string, Family> families_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_METRIC_STORE_H_
