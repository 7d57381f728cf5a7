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

#ifndef COMPONENTS_HTTP_HTTP_CLIENT_H_
#define COMPONENTS_HTTP_HTTP_CLIENT_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "components/http/http_message.h"

namespace telemetry_relay {

// Blocking HTTP client used by exporters. A returned response may carry any
// status code; transport failures come back as UNAVAILABLE, timeouts as
// DEADLINE_EXCEEDED.
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual absl::StatusOr<HttpResponse> Post(const std::string& url,
                                            absl::string_view content_type,
                                            const std::string& body,
                                            absl::Duration timeout) = 0;

  virtual absl::StatusOr<HttpResponse> Get(const std::string& url,
                                           absl::Duration timeout) = 0;

  // libcurl based client. Safe to use from several threads.
  static std::unique_ptr<HttpClient> Create();
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_HTTP_HTTP_CLIENT_H_
