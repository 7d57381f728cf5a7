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

#ifndef COMPONENTS_HEALTH_SELF_METRICS_H_
#define COMPONENTS_HEALTH_SELF_METRICS_H_

#include <string>
#include <vector>

#include "components/pipeline/memory_limiter.h"
#include "components/pipeline/relay_stats.h"
#include "prometheus/metric_family.h"

namespace telemetry_relay {

// The relay's own counters and memory limiter gauges as metric families.
// Every family is prefixed with `telemetry_relay_`.
std::vector<prometheus::MetricFamily> CollectSelfMetrics(
    const RelayStatsSnapshot& stats,
    const std::vector<const MemoryLimiter*>& limiters, bool ready);

}  // namespace telemetry_relay

#endif  // COMPONENTS_HEALTH_SELF_METRICS_H_
