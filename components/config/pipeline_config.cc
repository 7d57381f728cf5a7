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

#include "components/config/pipeline_config.h"

#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "components/errors/error_tag.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/message_differencer.h"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

using google::protobuf::util::MessageDifferencer;

enum class ErrorTag : int {
  kUnreadableFile = 1,
  kParseError = 2,
  kDuplicateName = 3,
  kMissingName = 4,
  kUnknownProtocol = 5,
  kInvalidEndpoint = 6,
  kDanglingReference = 7,
  kInvalidWiring = 8,
  kInvalidLimits = 9,
  kTopologyChanged = 10,
  kOutOfRange = 11,
};

constexpr uint32_t kDefaultMaxAttempts = 5;
constexpr uint32_t kMaxAttemptsLimit = 1000;
constexpr absl::Duration kDefaultInitialBackoff = absl::Milliseconds(100);
constexpr absl::Duration kDefaultMaxBackoff = absl::Seconds(30);
constexpr double kDefaultBackoffMultiplier = 2.0;
constexpr absl::Duration kDefaultExportTimeout = absl::Seconds(5);
constexpr size_t kDefaultQueueSize = 100;
constexpr absl::Duration kDefaultMetricExpiration = absl::Minutes(5);

absl::Status ConfigError(ErrorTag tag, absl::string_view message) {
  return StatusWithErrorTag(absl::InvalidArgumentError(message), __FILE__,
                            tag);
}

// Collects text format errors instead of printing them to stderr.
class ErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  void AddError(int line, int column, const std::string& message) override {
    absl::StrAppend(&errors_, errors_.empty() ? "" : "; ", "line ", line + 1,
                    ":", column + 1, ": ", message);
  }
  const std::string& errors() const { return errors_; }

 private:
  std::string errors_;
};

template <typename Message>
absl::Status CheckNames(
    const google::protobuf::RepeatedPtrField<Message>& items,
    absl::string_view section) {
  absl::flat_hash_set<std::string> names;
  for (const Message& item : items) {
    if (item.name().empty()) {
      return ConfigError(ErrorTag::kMissingName,
                         absl::StrCat(section, " entry without a name"));
    }
    if (!names.insert(item.name()).second) {
      return ConfigError(ErrorTag::kDuplicateName,
                         absl::StrCat("duplicate ", section, " name '",
                                      item.name(), "'"));
    }
  }
  return absl::OkStatus();
}

bool IsHttpUrl(absl::string_view endpoint) {
  for (absl::string_view scheme : {"http://", "https://"}) {
    if (absl::StartsWith(endpoint, scheme) && endpoint.size() > scheme.size()) {
      return true;
    }
  }
  return false;
}

absl::Status CheckHostPort(absl::string_view owner,
                           absl::string_view endpoint) {
  if (absl::StatusOr<HostPort> parsed = ParseHostPort(endpoint); !parsed.ok()) {
    return ConfigError(ErrorTag::kInvalidEndpoint,
                       absl::StrCat(owner, ": ", parsed.status().message()));
  }
  return absl::OkStatus();
}

absl::Status ValidateReceiver(const ReceiverConfig& receiver) {
  if (receiver.protocol() == ReceiverConfig::PROTOCOL_UNSPECIFIED) {
    return ConfigError(
        ErrorTag::kUnknownProtocol,
        absl::StrCat("receiver '", receiver.name(), "' has no protocol"));
  }
  if (receiver.max_request_bytes() >
      static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    return ConfigError(ErrorTag::kOutOfRange,
                       absl::StrCat("receiver '", receiver.name(),
                                    "' max_request_bytes is above ",
                                    std::numeric_limits<int>::max()));
  }
  return CheckHostPort(absl::StrCat("receiver '", receiver.name(), "'"),
                       receiver.endpoint());
}

absl::Status ValidateProcessor(const ProcessorConfig& processor) {
  switch (processor.processor_case()) {
    case ProcessorConfig::kMemoryLimiter: {
      const MemoryLimiterConfig& limiter = processor.memory_limiter();
      if (limiter.hard_limit_bytes() == 0) {
        return ConfigError(ErrorTag::kInvalidLimits,
                           absl::StrCat("memory limiter '", processor.name(),
                                        "' needs hard_limit_bytes"));
      }
      if (limiter.soft_limit_bytes() > limiter.hard_limit_bytes()) {
        return ConfigError(ErrorTag::kInvalidLimits,
                           absl::StrCat("memory limiter '", processor.name(),
                                        "' soft limit is above its hard "
                                        "limit"));
      }
      return absl::OkStatus();
    }
    case ProcessorConfig::kBatch: {
      const BatchConfig& batch = processor.batch();
      if (batch.send_batch_max_size() != 0 &&
          batch.send_batch_size() > batch.send_batch_max_size()) {
        return ConfigError(ErrorTag::kInvalidLimits,
                           absl::StrCat("batch processor '", processor.name(),
                                        "' send_batch_size is above "
                                        "send_batch_max_size"));
      }
      return absl::OkStatus();
    }
    case ProcessorConfig::kResource:
      return absl::OkStatus();
    case ProcessorConfig::PROCESSOR_NOT_SET:
      break;
  }
  return ConfigError(
      ErrorTag::kUnknownProtocol,
      absl::StrCat("processor '", processor.name(), "' has no settings"));
}

absl::Status ValidateExporter(const ExporterConfig& exporter) {
  const std::string owner = absl::StrCat("exporter '", exporter.name(), "'");
  if (exporter.retry().max_attempts() > kMaxAttemptsLimit) {
    return ConfigError(ErrorTag::kOutOfRange,
                       absl::StrCat(owner, ": retry max_attempts is above ",
                                    kMaxAttemptsLimit));
  }
  switch (exporter.protocol()) {
    case ExporterConfig::PROTOCOL_ZIPKIN:
    case ExporterConfig::PROTOCOL_OTLP_HTTP:
      if (!IsHttpUrl(exporter.endpoint())) {
        return ConfigError(ErrorTag::kInvalidEndpoint,
                           absl::StrCat(owner, ": endpoint '",
                                        exporter.endpoint(),
                                        "' is not an http(s) URL"));
      }
      return absl::OkStatus();
    case ExporterConfig::PROTOCOL_GRPC:
    case ExporterConfig::PROTOCOL_PROMETHEUS:
      return CheckHostPort(owner, exporter.endpoint());
    case ExporterConfig::PROTOCOL_LOGGING:
      return absl::OkStatus();
    default:
      break;
  }
  return ConfigError(ErrorTag::kUnknownProtocol,
                     absl::StrCat(owner, " has no protocol"));
}

// Position of a processor kind in the fixed chain.
int ChainPosition(const ProcessorConfig& processor) {
  switch (processor.processor_case()) {
    case ProcessorConfig::kMemoryLimiter:
      return 0;
    case ProcessorConfig::kResource:
      return 1;
    case ProcessorConfig::kBatch:
      return 2;
    case ProcessorConfig::PROCESSOR_NOT_SET:
      break;
  }
  return -1;
}

bool CarriesSignal(const ExporterConfig& exporter,
                   PipelineDefinition::Signal signal) {
  switch (exporter.protocol()) {
    case ExporterConfig::PROTOCOL_ZIPKIN:
      return signal == PipelineDefinition::SIGNAL_TRACES;
    case ExporterConfig::PROTOCOL_PROMETHEUS:
      return signal == PipelineDefinition::SIGNAL_METRICS;
    default:
      return true;
  }
}

absl::Status ValidatePipeline(const PipelineConfig& config,
                              const PipelineDefinition& pipeline) {
  const std::string owner = absl::StrCat("pipeline '", pipeline.name(), "'");
  if (pipeline.signal() == PipelineDefinition::SIGNAL_UNSPECIFIED) {
    return ConfigError(ErrorTag::kInvalidWiring,
                       absl::StrCat(owner, " has no signal"));
  }
  if (pipeline.receivers().empty()) {
    return ConfigError(ErrorTag::kInvalidWiring,
                       absl::StrCat(owner, " has no receivers"));
  }
  if (pipeline.exporters().empty()) {
    return ConfigError(ErrorTag::kInvalidWiring,
                       absl::StrCat(owner, " has no exporters"));
  }
  for (const std::string& name : pipeline.receivers()) {
    if (FindReceiver(config, name) == nullptr) {
      return ConfigError(ErrorTag::kDanglingReference,
                         absl::StrCat(owner, " references unknown receiver '",
                                      name, "'"));
    }
  }
  int previous_position = -1;
  for (const std::string& name : pipeline.processors()) {
    const ProcessorConfig* processor = FindProcessor(config, name);
    if (processor == nullptr) {
      return ConfigError(ErrorTag::kDanglingReference,
                         absl::StrCat(owner, " references unknown processor '",
                                      name, "'"));
    }
    const int position = ChainPosition(*processor);
    if (position <= previous_position) {
      return ConfigError(
          ErrorTag::kInvalidWiring,
          absl::StrCat(owner, " lists processor '", name,
                       "' out of order; use at most one memory limiter, "
                       "resource and batch processor, in that order"));
    }
    previous_position = position;
  }
  absl::flat_hash_set<std::string> exporters;
  for (const std::string& name : pipeline.exporters()) {
    const ExporterConfig* exporter = FindExporter(config, name);
    if (exporter == nullptr) {
      return ConfigError(ErrorTag::kDanglingReference,
                         absl::StrCat(owner, " references unknown exporter '",
                                      name, "'"));
    }
    if (!exporters.insert(name).second) {
      return ConfigError(ErrorTag::kInvalidWiring,
                         absl::StrCat(owner, " lists exporter '", name,
                                      "' twice"));
    }
    if (!CarriesSignal(*exporter, pipeline.signal())) {
      return ConfigError(
          ErrorTag::kInvalidWiring,
          absl::StrCat(owner, " cannot send ",
                       PipelineDefinition::Signal_Name(pipeline.signal()),
                       " to exporter '", name, "'"));
    }
  }
  return absl::OkStatus();
}

template <typename Message>
const Message* FindByName(
    const google::protobuf::RepeatedPtrField<Message>& items,
    absl::string_view name) {
  for (const Message& item : items) {
    if (item.name() == name) {
      return &item;
    }
  }
  return nullptr;
}

}  // namespace

absl::StatusOr<PipelineConfig> ParsePipelineConfig(absl::string_view text) {
  PipelineConfig config;
  ErrorCollector errors;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&errors);
  if (!parser.ParseFromString(std::string(text), &config)) {
    return ConfigError(ErrorTag::kParseError,
                       absl::StrCat("invalid pipeline config: ",
                                    errors.errors()));
  }
  return config;
}

absl::StatusOr<PipelineConfig> LoadPipelineConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return StatusWithErrorTag(
        absl::NotFoundError(absl::StrCat("cannot open config file ", path)),
        __FILE__, ErrorTag::kUnreadableFile);
  }
  std::stringstream contents;
  contents << file.rdbuf();
  absl::StatusOr<PipelineConfig> config = ParsePipelineConfig(contents.str());
  if (!config.ok()) {
    return config.status();
  }
  if (absl::Status status = ValidatePipelineConfig(*config); !status.ok()) {
    return status;
  }
  return config;
}

absl::Status ValidatePipelineConfig(const PipelineConfig& config) {
  if (absl::Status status = CheckNames(config.receivers(), "receiver");
      !status.ok()) {
    return status;
  }
  if (absl::Status status = CheckNames(config.processors(), "processor");
      !status.ok()) {
    return status;
  }
  if (absl::Status status = CheckNames(config.exporters(), "exporter");
      !status.ok()) {
    return status;
  }
  if (absl::Status status = CheckNames(config.pipelines(), "pipeline");
      !status.ok()) {
    return status;
  }
  for (const ReceiverConfig& receiver : config.receivers()) {
    if (absl::Status status = ValidateReceiver(receiver); !status.ok()) {
      return status;
    }
  }
  for (const ProcessorConfig& processor : config.processors()) {
    if (absl::Status status = ValidateProcessor(processor); !status.ok()) {
      return status;
    }
  }
  for (const ExporterConfig& exporter : config.exporters()) {
    if (absl::Status status = ValidateExporter(exporter); !status.ok()) {
      return status;
    }
  }
  for (const PipelineDefinition& pipeline : config.pipelines()) {
    if (absl::Status status = ValidatePipeline(config, pipeline);
        !status.ok()) {
      return status;
    }
  }
  if (!config.service().health_endpoint().empty()) {
    return CheckHostPort("service health endpoint",
                         config.service().health_endpoint());
  }
  return absl::OkStatus();
}

absl::Status CheckSameTopology(const PipelineConfig& active,
                               const PipelineConfig& candidate) {
  auto changed = [](absl::string_view what) {
    return ConfigError(ErrorTag::kTopologyChanged,
                       absl::StrCat(what, " changed; restart the relay to "
                                          "apply it"));
  };
  if (active.receivers_size() != candidate.receivers_size() ||
      active.processors_size() != candidate.processors_size() ||
      active.exporters_size() != candidate.exporters_size() ||
      active.pipelines_size() != candidate.pipelines_size()) {
    return changed("number of components");
  }
  for (int i = 0; i < active.receivers_size(); ++i) {
    if (!MessageDifferencer::Equals(active.receivers(i),
                                    candidate.receivers(i))) {
      return changed(absl::StrCat("receiver '", active.receivers(i).name(),
                                  "'"));
    }
  }
  for (int i = 0; i < active.processors_size(); ++i) {
    const ProcessorConfig& before = active.processors(i);
    const ProcessorConfig& after = candidate.processors(i);
    if (before.name() != after.name() ||
        before.processor_case() != after.processor_case()) {
      return changed(absl::StrCat("processor '", before.name(), "'"));
    }
  }
  for (int i = 0; i < active.exporters_size(); ++i) {
    ExporterConfig before = active.exporters(i);
    ExporterConfig after = candidate.exporters(i);
    before.clear_retry();
    before.clear_timeout_ms();
    after.clear_retry();
    after.clear_timeout_ms();
    if (!MessageDifferencer::Equals(before, after)) {
      return changed(absl::StrCat("exporter '", before.name(), "'"));
    }
  }
  for (int i = 0; i < active.pipelines_size(); ++i) {
    if (!MessageDifferencer::Equals(active.pipelines(i),
                                    candidate.pipelines(i))) {
      return changed(absl::StrCat("pipeline '", active.pipelines(i).name(),
                                  "'"));
    }
  }
  if (!MessageDifferencer::Equals(active.service(), candidate.service())) {
    return changed("service section");
  }
  return absl::OkStatus();
}

const ReceiverConfig* FindReceiver(const PipelineConfig& config,
                                   absl::string_view name) {
  return FindByName(config.receivers(), name);
}

const ProcessorConfig* FindProcessor(const PipelineConfig& config,
                                     absl::string_view name) {
  return FindByName(config.processors(), name);
}

const ExporterConfig* FindExporter(const PipelineConfig& config,
                                   absl::string_view name) {
  return FindByName(config.exporters(), name);
}

RetrySettings GetRetrySettings(const ExporterConfig& exporter) {
  const config::v1::RetryPolicy& retry = exporter.retry();
  RetrySettings settings;
  settings.max_attempts = static_cast<int>(
      retry.max_attempts() == 0 ? kDefaultMaxAttempts : retry.max_attempts());
  settings.backoff.initial_backoff =
      retry.initial_backoff_ms() == 0
          ? kDefaultInitialBackoff
          : absl::Milliseconds(retry.initial_backoff_ms());
  settings.backoff.max_backoff =
      retry.max_backoff_ms() == 0 ? kDefaultMaxBackoff
                                  : absl::Milliseconds(retry.max_backoff_ms());
  settings.backoff.multiplier = retry.backoff_multiplier() <= 0
                                    ? kDefaultBackoffMultiplier
                                    : retry.backoff_multiplier();
  return settings;
}

absl::Duration GetExportTimeout(const ExporterConfig& exporter) {
  return exporter.timeout_ms() == 0 ? kDefaultExportTimeout
                                    : absl::Milliseconds(exporter.timeout_ms());
}

size_t GetQueueSize(const ExporterConfig& exporter) {
  return exporter.queue_size() == 0 ? kDefaultQueueSize
                                    : exporter.queue_size();
}

absl::Duration GetMetricExpiration(const ExporterConfig& exporter) {
  return exporter.metric_expiration_ms() == 0
             ? kDefaultMetricExpiration
             : absl::Milliseconds(exporter.metric_expiration_ms());
}

uint64_t GetMaxRequestBytes(const ReceiverConfig& receiver) {
  return receiver.max_request_bytes() == 0 ? kDefaultMaxRequestBytes
                                           : receiver.max_request_bytes();
}

uint64_t GetSoftLimitBytes(const MemoryLimiterConfig& limiter) {
  return limiter.soft_limit_bytes() == 0 ? limiter.hard_limit_bytes()
                                         : limiter.soft_limit_bytes();
}

}  // namespace telemetry_relay
