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

#ifndef COMPONENTS_RECEIVERS_MOCKS_H_
#define COMPONENTS_RECEIVERS_MOCKS_H_

#include <string>

#include "components/receivers/receiver.h"
#include "gmock/gmock.h"

namespace telemetry_relay {

class MockReceiver : public Receiver {
 public:
  MOCK_METHOD(absl::Status, Start, (), (override));
  MOCK_METHOD(void, Stop, (), (override));
  MOCK_METHOD(bool, IsListening, (), (const, override));
  MOCK_METHOD(uint16_t, port, (), (const, override));
  MOCK_METHOD(const std::string&, name, (), (const, override));
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_RECEIVERS_MOCKS_H_
