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

#ifndef COMPONENTS_HTTP_MOCKS_H_
#define COMPONENTS_HTTP_MOCKS_H_

#include <string>

#include "components/http/http_client.h"
#include "gmock/gmock.h"

namespace telemetry_relay {

class MockHttpClient : public HttpClient {
 public:
  MOCK_METHOD(absl::StatusOr<HttpResponse>, Post,
              (const std::string& url, absl::string_view content_type,
               const std::string& body, absl::Duration timeout),
              (override));
  MOCK_METHOD(absl::StatusOr<HttpResponse>, Get,
              (const std::string& url, absl::Duration timeout), (override));
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_HTTP_MOCKS_H_
