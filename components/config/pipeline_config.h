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

#ifndef COMPONENTS_CONFIG_PIPELINE_CONFIG_H_
#define COMPONENTS_CONFIG_PIPELINE_CONFIG_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "components/errors/retry.h"
#include "components/util/host_port.h"
#include "public/config/v1/pipeline_config.pb.h"

namespace telemetry_relay {

using config::v1::BatchConfig;
using config::v1::ExporterConfig;
using config::v1::MemoryLimiterConfig;
using config::v1::PipelineConfig;
using config::v1::PipelineDefinition;
using config::v1::ProcessorConfig;
using config::v1::ReceiverConfig;
using config::v1::ResourceConfig;

// Parses a protobuf text format document. Does not validate the wiring.
absl::StatusOr<PipelineConfig> ParsePipelineConfig(absl::string_view text);

// Reads, parses and validates the document at `path`.
absl::StatusOr<PipelineConfig> LoadPipelineConfig(const std::string& path);

// Rejects documents the relay cannot be assembled from:
//  - empty or duplicate names within receivers, processors, exporters or
//    pipelines;
//  - unspecified protocols or signals, unparsable endpoints;
//  - pipeline references to undeclared receivers, processors or exporters;
//  - pipelines without receivers or exporters;
//  - processors out of the memory limiter, resource, batch order;
//  - exporters wired to a signal they cannot carry;
//  - memory limiter soft limit above its hard limit.
absl::Status ValidatePipelineConfig(const PipelineConfig& config);

// Succeeds when `candidate` only changes tunables of `active`: memory limits,
// resource attributes, batch sizes and timeouts, exporter retry policies and
// timeouts. Anything else requires a restart.
absl::Status CheckSameTopology(const PipelineConfig& active,
                               const PipelineConfig& candidate);

// Lookups by name. Return nullptr when absent.
const ReceiverConfig* FindReceiver(const PipelineConfig& config,
                                   absl::string_view name);
const ProcessorConfig* FindProcessor(const PipelineConfig& config,
                                     absl::string_view name);
const ExporterConfig* FindExporter(const PipelineConfig& config,
                                   absl::string_view name);

// Effective values with the documented defaults applied.
struct RetrySettings {
  int max_attempts;
  BackoffPolicy backoff;
};
RetrySettings GetRetrySettings(const ExporterConfig& exporter);
absl::Duration GetExportTimeout(const ExporterConfig& exporter);
size_t GetQueueSize(const ExporterConfig& exporter);
absl::Duration GetMetricExpiration(const ExporterConfig& exporter);
uint64_t GetMaxRequestBytes(const ReceiverConfig& receiver);
// Soft limit 0 means the hard limit.
uint64_t GetSoftLimitBytes(const MemoryLimiterConfig& limiter);

}  // namespace telemetry_relay

#endif  // COMPONENTS_CONFIG_PIPELINE_CONFIG_H_
