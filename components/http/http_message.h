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

#ifndef COMPONENTS_HTTP_HTTP_MESSAGE_H_
#define COMPONENTS_HTTP_HTTP_MESSAGE_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace telemetry_relay {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string query;
  // Keys are lowercase.
  absl::flat_hash_map<std::string, std::string> headers;
  std::string body;

  // Value of header `name` (any case), empty when absent.
  absl::string_view Header(absl::string_view name) const;
};

struct HttpResponse {
  int status_code = 200;
  std::string content_type;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

HttpResponse TextResponse(int status_code, std::string body);
HttpResponse JsonResponse(int status_code, std::string body);

absl::string_view ReasonPhrase(int status_code);

// Status line, headers and body. Always announces `Connection: close`.
std::string SerializeResponse(const HttpResponse& response);

// Parses the request line and headers, up to but excluding the blank line.
absl::StatusOr<HttpRequest> ParseRequestHead(absl::string_view head);

// Classifies a response of a remote HTTP endpoint: 2xx is OK, 408 and 429
// and 5xx are retryable, everything else is a permanent rejection.
absl::Status StatusFromHttpCode(int status_code, absl::string_view body);

}  // namespace telemetry_relay

#endif  // COMPONENTS_HTTP_HTTP_MESSAGE_H_
