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

#ifndef COMPONENTS_EXPORTERS_EXPORTER_FACTORY_H_
#define COMPONENTS_EXPORTERS_EXPORTER_FACTORY_H_

#include <memory>

#include "absl/status/statusor.h"
#include "components/exporters/exporter.h"

namespace telemetry_relay {

// Builds the exporter for the protocol of `settings()`. Nothing is connected
// or bound until `Start` and the first export.
absl::StatusOr<std::unique_ptr<Exporter>> CreateExporter(
    ExporterSettingsProvider settings);

}  // namespace telemetry_relay

#endif  // COMPONENTS_EXPORTERS_EXPORTER_FACTORY_H_
