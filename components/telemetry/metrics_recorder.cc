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

#include "components/telemetry/metrics_recorder.h"

#include <utility>

#include "absl/container/flat_hash_map.h"
#include "opentelemetry/common/key_value_iterable_view.h"
#include "opentelemetry/context/runtime_context.h"
#include "opentelemetry/metrics/provider.h"
#include "opentelemetry/sdk/metrics/aggregation/aggregation_config.h"
#include "opentelemetry/sdk/metrics/meter_provider.h"
#include "opentelemetry/sdk/metrics/view/instrument_selector.h"
#include "opentelemetry/sdk/metrics/view/meter_selector.h"
#include "opentelemetry/sdk/metrics/view/view.h"

namespace metric_sdk = opentelemetry::sdk::metrics;
namespace metrics_api = opentelemetry::metrics;
namespace nostd = opentelemetry::nostd;

namespace telemetry_relay {
namespace {

constexpr char kLatencyInstrument[] = "relay.latency";
constexpr char kSchemaUrl[] = "https://opentelemetry.io/schemas/1.2.0";

// Microseconds. Export attempts range from sub-millisecond local writes to
// multi-second remote timeouts.
constexpr double kLatencyBucketsUs[] = {
    50,      100,     250,       500,       1'000,     2'500,
    5'000,   10'000,  25'000,    50'000,    100'000,   250'000,
    500'000, 1'000'000, 2'500'000, 5'000'000, 10'000'000, 30'000'000,
};

using Labels = absl::flat_hash_map<std::string, std::string>;

class MetricsRecorderImpl : public MetricsRecorder {
 public:
  MetricsRecorderImpl(std::string service_name, std::string build_version)
      : service_name_(std::move(service_name)),
        build_version_(std::move(build_version)) {
    RegisterLatencyView();
    auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(
        service_name_, build_version_, kSchemaUrl);
    event_status_count_ = meter->CreateUInt64Counter(
        "relay.event_status", "Count of relay events by final status code.");
    latency_ = meter->CreateUInt64Histogram(
        kLatencyInstrument, "Latency of relay operations.", "us");
  }

  void IncrementEventStatus(std::string event, absl::Status status,
                            uint64_t count) override {
    Labels labels = {{"event", std::move(event)},
                     {"status", absl::StatusCodeToString(status.code())}};
    event_status_count_->Add(
        count, opentelemetry::common::KeyValueIterableView<Labels>(labels));
  }

  void RecordLatency(std::string event, absl::Duration duration) override {
    Labels labels = {{"event", std::move(event)}};
    latency_->Record(
        static_cast<uint64_t>(absl::ToInt64Microseconds(duration)),
        opentelemetry::common::KeyValueIterableView<Labels>(labels),
        opentelemetry::context::RuntimeContext::GetCurrent());
  }

 private:
  // The default histogram boundaries are tuned for milliseconds; replace them
  // when an SDK provider is installed.
  void RegisterLatencyView() {
    auto provider = metrics_api::Provider::GetMeterProvider();
    auto* sdk_provider =
        dynamic_cast<metric_sdk::MeterProvider*>(provider.get());
    if (sdk_provider == nullptr) {
      return;
    }
    auto config = std::make_shared<metric_sdk::HistogramAggregationConfig>();
    config->boundaries_.assign(std::begin(kLatencyBucketsUs),
                               std::end(kLatencyBucketsUs));
    sdk_provider->AddView(
        std::make_unique<metric_sdk::InstrumentSelector>(
            metric_sdk::InstrumentType::kHistogram, kLatencyInstrument),
        std::make_unique<metric_sdk::MeterSelector>(service_name_,
                                                    build_version_, kSchemaUrl),
        std::make_unique<metric_sdk::View>(
            kLatencyInstrument, "Latency of relay operations.",
            metric_sdk::AggregationType::kHistogram, std::move(config)));
  }

  std::string service_name_;
  std::string build_version_;
  nostd::unique_ptr<metrics_api::Counter<uint64_t>> event_status_count_;
  nostd::unique_ptr<metrics_api::Histogram<uint64_t>> latency_;
};

}  // namespace

ScopeLatencyRecorder::ScopeLatencyRecorder(std::string event_name,
                                           MetricsRecorder& metrics_recorder)
    : event_name_(std::move(event_name)), metrics_recorder_(metrics_recorder) {}

ScopeLatencyRecorder::~ScopeLatencyRecorder() {
  metrics_recorder_.RecordLatency(event_name_, GetLatency());
}

absl::Duration ScopeLatencyRecorder::GetLatency() const {
  return stopwatch_.GetElapsedTime();
}

std::unique_ptr<MetricsRecorder> MetricsRecorder::Create(
    std::string service_name, std::string build_version) {
  return std::make_unique<MetricsRecorderImpl>(std::move(service_name),
                                               std::move(build_version));
}

}  // namespace telemetry_relay
