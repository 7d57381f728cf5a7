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

#include "components/exporters/metric_store.h"

#include <iterator>
#include <limits>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "prometheus/client_metric.h"

namespace telemetry_relay {
namespace {

constexpr absl::string_view kTotalSuffix = "_total";

bool IsNameChar(char c, bool allow_colon) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         (allow_colon && c == ':');
}

// Maps OTLP names such as `http.server.duration` onto the exposition
// alphabet, [a-zA-Z_:][a-zA-Z0-9_:]* for metrics and no colon for labels.
std::string Sanitize(absl::string_view name, bool allow_colon) {
  std::string sanitized;
  sanitized.reserve(name.size() + 1);
  if (name.empty() ||
      absl::ascii_isdigit(static_cast<unsigned char>(name.front()))) {
    sanitized.push_back('_');
  }
  for (char c : name) {
    sanitized.push_back(IsNameChar(c, allow_colon) ? c : '_');
  }
  return sanitized;
}

std::string FamilyName(const v1::MetricPoint& point) {
  std::string name = Sanitize(point.name(), /*allow_colon=*/true);
  if (point.kind() == v1::MetricPoint::KIND_COUNTER &&
      !absl::EndsWith(name, kTotalSuffix)) {
    absl::StrAppend(&name, kTotalSuffix);
  }
  return name;
}

prometheus::MetricType TypeOf(v1::MetricPoint::Kind kind) {
  switch (kind) {
    case v1::MetricPoint::KIND_COUNTER:
      return prometheus::MetricType::Counter;
    case v1::MetricPoint::KIND_GAUGE:
      return prometheus::MetricType::Gauge;
    case v1::MetricPoint::KIND_HISTOGRAM:
      return prometheus::MetricType::Histogram;
    default:
      return prometheus::MetricType::Untyped;
  }
}

absl::string_view TypeName(v1::MetricPoint::Kind kind) {
  switch (TypeOf(kind)) {
    case prometheus::MetricType::Counter:
      return "counter";
    case prometheus::MetricType::Gauge:
      return "gauge";
    case prometheus::MetricType::Histogram:
      return "histogram";
    default:
      return "untyped";
  }
}

}  // namespace

void MetricStore::Update(const TelemetryBatch& batch, bool resource_labels,
                         absl::Time now) {
  absl::MutexLock lock(&mutex_);
  for (const v1::Record& record : batch.records()) {
    if (!record.has_metric()) {
      continue;
    }
    SeriesLabels labels;
    for (const auto& [key, value] : record.metric().labels()) {
      labels[Sanitize(key, /*allow_colon=*/false)] = value;
    }
    if (resource_labels) {
      for (const auto& [key, value] : record.resource()) {
        labels.emplace(Sanitize(key, /*allow_colon=*/false),
                       AttributeValueToString(value));
      }
    }
    // Reserved for histogram buckets.
    labels.erase("le");
    Apply(record.metric(), std::move(labels), now);
  }
}

void MetricStore::Apply(const v1::MetricPoint& point, SeriesLabels labels,
                        absl::Time now) {
  const std::string name = FamilyName(point);
  auto [it, inserted] = families_.try_emplace(name);
  Family& family = it->second;
  if (inserted) {
    family.kind = point.kind();
  } else if (family.kind != point.kind()) {
    LOG_EVERY_N_SEC(WARNING, 60)
        << "Dropping " << TypeName(point.kind()) << " point of " << name
        << ", already exposed as " << TypeName(family.kind);
    return;
  }
  if (!point.description().empty()) {
    family.help = point.description();
  }

  const bool delta =
      point.temporality() == v1::MetricPoint::TEMPORALITY_DELTA;
  auto [series_it, new_series] =
      family.series.try_emplace(std::move(labels));
  Series& series = series_it->second;
  series.updated = now;
  switch (point.kind()) {
    case v1::MetricPoint::KIND_COUNTER:
      series.value = delta && !new_series ? series.value + point.value()
                                          : point.value();
      break;
    case v1::MetricPoint::KIND_HISTOGRAM: {
      const v1::Histogram& histogram = point.histogram();
      const std::vector<double> bounds(histogram.explicit_bounds().begin(),
                                       histogram.explicit_bounds().end());
      if (delta && !new_series && bounds == series.bounds) {
        for (int i = 0; i < histogram.bucket_counts_size(); ++i) {
          series.bucket_counts[i] += histogram.bucket_counts(i);
        }
        series.sum += histogram.sum();
      } else {
        series.bounds = bounds;
        series.bucket_counts.assign(histogram.bucket_counts().begin(),
                                    histogram.bucket_counts().end());
        series.sum = histogram.sum();
      }
      break;
    }
    default:
      series.value = point.value();
  }
}

size_t MetricStore::Expire(absl::Time now, absl::Duration expiration) {
  const absl::Time cutoff = now - expiration;
  size_t dropped = 0;
  absl::MutexLock lock(&mutex_);
  for (auto family = families_.begin(); family != families_.end();) {
    auto& series = family->second.series;
    for (auto it = series.begin(); it != series.end();) {
      if (it->second.updated < cutoff) {
        it = series.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
    family = series.empty() ? families_.erase(family) : std::next(family);
  }
  return dropped;
}

std::vector<prometheus::MetricFamily> MetricStore::Collect() const {
  std::vector<prometheus::MetricFamily> families;
  absl::MutexLock lock(&mutex_);
  families.reserve(families_.size());
  for (const auto& [name, family] : families_) {
    families.push_back(ToFamily(name, family));
  }
  return families;
}

prometheus::MetricFamily MetricStore::ToFamily(const std::string& name,
                                               const Family& family) {
  prometheus::MetricFamily out;
  out.name = name;
  out.help = family.help;
  out.type = TypeOf(family.kind);
  out.metric.reserve(family.series.size());
  for (const auto& [labels, series] : family.series) {
    prometheus::ClientMetric metric;
    for (const auto& [label, value] : labels) {
      metric.label.push_back(prometheus::ClientMetric::Label{label, value});
    }
    switch (out.type) {
      case prometheus::MetricType::Counter:
        metric.counter.value = series.value;
        break;
      case prometheus::MetricType::Gauge:
        metric.gauge.value = series.value;
        break;
      case prometheus::MetricType::Histogram: {
        uint64_t cumulative = 0;
        for (size_t i = 0; i < series.bucket_counts.size(); ++i) {
          cumulative += series.bucket_counts[i];
          const double upper_bound =
              i < series.bounds.size()
                  ? series.bounds[i]
                  : std::numeric_limits<double>::infinity();
          metric.histogram.bucket.push_back(
              prometheus::ClientMetric::Bucket{cumulative, upper_bound});
        }
        metric.histogram.sample_count = cumulative;
        metric.histogram.sample_sum = series.sum;
        break;
      }
      default:
        metric.untyped.value = series.value;
    }
    out.metric.push_back(std::move(metric));
  }
  return out;
}

size_t MetricStore::series_count() const {
  absl::MutexLock lock(&mutex_);
  size_t count = 0;
  for (const auto& [name, family] : families_) {
    count += family.series.size();
  }
  return count;
}

}  // namespace telemetry_relay
