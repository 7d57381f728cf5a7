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

#ifndef COMPONENTS_RECEIVERS_RECEIVER_H_
#define COMPONENTS_RECEIVERS_RECEIVER_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"

namespace telemetry_relay {

// A listening ingestion endpoint.
class Receiver {
 public:
  virtual ~Receiver() = default;

  // Binds and starts serving. Returns once the endpoint accepts connections.
  virtual absl::Status Start() = 0;

  // Stops accepting and waits for in-flight requests.
  virtual void Stop() = 0;

  virtual bool IsListening() const = 0;

  // Bound port, valid once started.
  virtual uint16_t port() const = 0;

  virtual const std::string& name() const = 0;
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_RECEIVERS_RECEIVER_H_
