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

#ifndef COMPONENTS_ERRORS_ERROR_TAG_H_
#define COMPONENTS_ERRORS_ERROR_TAG_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace telemetry_relay {

// Payload key for `file_path`: its base name.
inline absl::string_view ErrorTagKey(absl::string_view file_path) {
  const size_t slash = file_path.rfind('/');
  return slash == absl::string_view::npos ? file_path
                                         : file_path.substr(slash + 1);
}

// Sets the payload for an absl::Status
// The payload key is the file_name extracted from file_path
// The payload value is the error_tag_enum
template <typename T>
inline absl::Status StatusWithErrorTag(absl::Status status,
                                       absl::string_view file_path,
                                       T error_tag_enum) {
  status.SetPayload(ErrorTagKey(file_path),
                    absl::Cord(absl::StrCat(static_cast<int>(error_tag_enum))));
  return status;
}

// Returns the tag `StatusWithErrorTag` attached for `file_path`, if any.
inline absl::optional<std::string> GetErrorTag(const absl::Status& status,
                                               absl::string_view file_path) {
  absl::optional<absl::Cord> payload =
      status.GetPayload(ErrorTagKey(file_path));
  if (!payload.has_value()) {
    return absl::nullopt;
  }
  return std::string(*payload);
}

}  // namespace telemetry_relay

#endif  // COMPONENTS_ERRORS_ERROR_TAG_H_
