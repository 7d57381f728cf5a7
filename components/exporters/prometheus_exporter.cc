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

#include "components/exporters/prometheus_exporter.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "components/config/pipeline_config.h"
#include "components/errors/error_tag.h"
#include "components/util/host_port.h"
#include "public/constants.h"

namespace telemetry_relay {
namespace {

enum class ErrorTag : int {
  kAlreadyStarted = 1,
  kCannotBind = 2,
};

// Longest pause between two expiry passes.
constexpr absl::Duration kMaxExpiryInterval = absl::Seconds(30);

// Listening spec understood by the embedded web server: the bare port for
// any address, brackets around IPv6 literals.
std::string BindAddress(const HostPort& host_port) {
  if (host_port.host.empty()) {
    return absl::StrCat(host_port.port);
  }
  if (absl::StrContains(host_port.host, ':')) {
    return absl::StrCat("[", host_port.host, "]:", host_port.port);
  }
  return absl::StrCat(host_port.host, ":", host_port.port);
}

}  // namespace

PrometheusExporter::PrometheusExporter(ExporterSettingsProvider settings)
    : settings_(std::move(settings)),
      store_(std::make_shared<MetricStore>()) {}

absl::Status PrometheusExporter::Start() {
  const ExporterConfig settings = settings_();
  if (exposer_ != nullptr) {
    return StatusWithErrorTag(
        absl::FailedPreconditionError(
            absl::StrCat(settings.name(), " already started")),
        __FILE__, ErrorTag::kAlreadyStarted);
  }
  absl::StatusOr<HostPort> host_port = ParseHostPort(settings.endpoint());
  if (!host_port.ok()) {
    return host_port.status();
  }
  try {
    exposer_ = std::make_unique<prometheus::Exposer>(BindAddress(*host_port));
  } catch (const std::exception& e) {
    return StatusWithErrorTag(
        absl::UnavailableError(absl::StrCat(
            settings.name(), ": cannot bind ", settings.endpoint(), ": ",
            e.what())),
        __FILE__, ErrorTag::kCannotBind);
  }
  exposer_->RegisterCollectable(store_, std::string(kExpositionPath));

  expiry_ = PeriodicClosure::Create(
      absl::StrCat(settings.name(), " series expiry"));
  if (absl::Status status = expiry_->StartDelayed(
          [this] {
            return std::min(GetMetricExpiration(settings_()) / 2,
                            kMaxExpiryInterval);
          },
          [this] { ExpireStaleSeries(); });
      !status.ok()) {
    return status;
  }
  LOG(INFO) << "Prometheus exporter " << settings.name() << " serving "
            << kExpositionPath << " on port " << port();
  return absl::OkStatus();
}

absl::Status PrometheusExporter::Export(const TelemetryBatch& batch) {
  store_->Update(batch, settings_().resource_to_telemetry_conversion(),
                 absl::Now());
  return absl::OkStatus();
}

void PrometheusExporter::Shutdown() {
  if (expiry_ != nullptr) {
    expiry_->Stop();
  }
  exposer_.reset();
}

uint16_t PrometheusExporter::port() const {
  if (exposer_ == nullptr) {
    return 0;
  }
  const std::vector<int> ports = exposer_->GetListeningPorts();
  return ports.empty() ? 0 : static_cast<uint16_t>(ports.front());
}

void PrometheusExporter::ExpireStaleSeries() {
  const size_t expired =
      store_->Expire(absl::Now(), GetMetricExpiration(settings_()));
  if (expired > 0) {
    VLOG(1) << "Expired " << expired << " stale series";
  }
}

}  // namespace telemetry_relay
