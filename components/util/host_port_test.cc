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

#include "components/util/host_port.h"

#include "gtest/gtest.h"

namespace telemetry_relay {
namespace {

TEST(HostPortTest, ParsesHostAndPort) {
  absl::StatusOr<HostPort> parsed = ParseHostPort("127.0.0.1:4317");
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed->host, "127.0.0.1");
  EXPECT_EQ(parsed->port, 4317);

  parsed = ParseHostPort(":0");
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed->host, "");
  EXPECT_EQ(parsed->port, 0);

  parsed = ParseHostPort("[::1]:80");
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(parsed->host, "::1");

  EXPECT_FALSE(ParseHostPort("localhost").ok());
  EXPECT_FALSE(ParseHostPort("localhost:http").ok());
}

TEST(HostPortTest, RejectsMissingBracket) {
  EXPECT_FALSE(ParseHostPort("[::1:80").ok());
}

}  // namespace
}  // namespace telemetry_relay
