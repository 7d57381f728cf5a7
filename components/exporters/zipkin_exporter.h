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

#ifndef COMPONENTS_EXPORTERS_ZIPKIN_EXPORTER_H_
#define COMPONENTS_EXPORTERS_ZIPKIN_EXPORTER_H_

#include <memory>
#include <string>
#include <utility>

#include "components/exporters/exporter.h"
#include "components/http/http_client.h"

namespace telemetry_relay {

// Zipkin v2 JSON span list for the spans of `batch`. Resource attributes are
// merged into the tags first so that span attributes win on conflicts.
std::string ToZipkinJson(const TelemetryBatch& batch);

// Posts spans to a Zipkin v2 collector, e.g.
// http://zipkin:9411/api/v2/spans or Jaeger's Zipkin-compatible endpoint.
class ZipkinExporter : public Exporter {
 public:
  ZipkinExporter(ExporterSettingsProvider settings,
                 std::unique_ptr<HttpClient> http_client)
      : settings_(std::move(settings)), http_client_(std::move(http_client)) {}

  absl::Status Export(const TelemetryBatch& batch) override;
  absl::Status CheckConnectivity() override;

 private:
  const ExporterSettingsProvider settings_;
  std::unique_ptr<HttpClient> http_client_;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_ZIPKIN_EXPORTER_H_
