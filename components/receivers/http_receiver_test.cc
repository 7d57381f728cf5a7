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

#include "components/receivers/http_receiver.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "components/http/http_client.h"
#include "components/pipeline/pipeline.h"
#include "components/telemetry/mocks.h"
#include "gmock/gmock.h"
#include "google/protobuf/util/json_util.h"
#include "gtest/gtest.h"
#include "public/constants.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using testing::Contains;
using testing::HasSubstr;
using testing::NiceMock;
using testing::Pair;

HttpRequest PostRequest(std::string path, std::string content_type,
                        std::string body) {
  HttpRequest request;
  request.method = "POST";
  request.path = std::move(path);
  request.headers["content-type"] = std::move(content_type);
  request.body = std::move(body);
  return request;
}

std::string SerializedRequest(std::vector<v1::Record> records) {
  v1::ExportRequest request;
  for (v1::Record& record : records) {
    *request.add_records() = std::move(record);
  }
  return request.SerializeAsString();
}

class HttpReceiverTest : public ::testing::Test {
 protected:
  HttpReceiverTest()
      : traces_("traces", Signal::kTraces, {},
                Fanout(std::vector<ExporterWorker*>()), 1, stats_),
        handler_("http", router_, stats_, metrics_recorder_),
        receiver_(MakeConfig(), handler_) {
    traces_.Start();
    router_.AddRoute("http", &traces_);
  }

  static ReceiverConfig MakeConfig() {
    ReceiverConfig config;
    config.set_name("http");
    config.set_protocol(ReceiverConfig::PROTOCOL_HTTP);
    config.set_endpoint("127.0.0.1:0");
    config.set_max_request_bytes(1024);
    return config;
  }

  RelayStats stats_;
  NiceMock<MockMetricsRecorder> metrics_recorder_;
  Pipeline traces_;
  Router router_{stats_};
  IngestHandler handler_;
  HttpReceiver receiver_;
};

TEST_F(HttpReceiverTest, AcceptsProtobufBody) {
  const HttpResponse response = receiver_.Handle(
      PostRequest("/v1/traces", "application/x-protobuf",
                  SerializedRequest({GetSpanRecord()})));

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.content_type, kContentTypeJson);
  v1::ExportResponse parsed;
  ASSERT_TRUE(
      google::protobuf::util::JsonStringToMessage(response.body, &parsed)
          .ok());
  EXPECT_EQ(parsed.accepted_records(), 1);
}

TEST_F(HttpReceiverTest, AcceptsJsonBody) {
  v1::ExportRequest request;
  *request.add_records() = GetSpanRecord();
  std::string body;
  ASSERT_TRUE(google::protobuf::util::MessageToJsonString(request, &body).ok());

  const HttpResponse response = receiver_.Handle(
      PostRequest("/v1/export", "application/json; charset=utf-8", body));

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(stats_.Snapshot().accepted_records, 1);
}

TEST_F(HttpReceiverTest, RejectsMalformedBodies) {
  EXPECT_EQ(receiver_
                .Handle(PostRequest("/v1/export", "application/json",
                                    "{\"records\": 7}"))
                .status_code,
            400);
  EXPECT_EQ(receiver_
                .Handle(PostRequest("/v1/export", "application/protobuf",
                                    "\xff\xff\xff"))
                .status_code,
            400);
  EXPECT_EQ(receiver_
                .Handle(PostRequest("/v1/export", "application/x-protobuf",
                                    SerializedRequest({v1::Record()})))
                .status_code,
            400);
  EXPECT_EQ(stats_.Snapshot().rejected_requests, 3);
}

TEST_F(HttpReceiverTest, SignalPathsRejectTheOtherSignal) {
  const HttpResponse response = receiver_.Handle(
      PostRequest("/v1/traces", "application/x-protobuf",
                  SerializedRequest({GetCounterRecord()})));

  EXPECT_EQ(response.status_code, 400);
  EXPECT_THAT(response.body, HasSubstr("errorMessage"));
}

TEST_F(HttpReceiverTest, NoPipelineIsBadRequest) {
  EXPECT_EQ(receiver_
                .Handle(PostRequest("/v1/metrics", "application/x-protobuf",
                                    SerializedRequest({GetCounterRecord()})))
                .status_code,
            400);
}

TEST_F(HttpReceiverTest, RoutingErrors) {
  EXPECT_EQ(
      receiver_.Handle(PostRequest("/v2/traces", "application/json", "{}"))
          .status_code,
      404);

  HttpRequest get = PostRequest("/v1/traces", "application/json", "{}");
  get.method = "GET";
  const HttpResponse not_allowed = receiver_.Handle(get);
  EXPECT_EQ(not_allowed.status_code, 405);
  EXPECT_THAT(not_allowed.headers, Contains(Pair("Allow", "POST")));

  EXPECT_EQ(receiver_.Handle(PostRequest("/v1/traces", "text/plain", "x"))
                .status_code,
            415);
}

TEST_F(HttpReceiverTest, UnavailableWhileShuttingDown) {
  router_.StopAccepting();

  EXPECT_EQ(receiver_
                .Handle(PostRequest("/v1/traces", "application/x-protobuf",
                                    SerializedRequest({GetSpanRecord()})))
                .status_code,
            503);
}

TEST(IngestResultToHttpTest, BackpressureCarriesRetryAfter) {
  const HttpResponse response =
      IngestResultToHttp(absl::ResourceExhaustedError("memory limit"));

  EXPECT_EQ(response.status_code, 429);
  EXPECT_THAT(response.headers, Contains(Pair("Retry-After", "1")));
  EXPECT_THAT(response.body, HasSubstr("memory limit"));
}

TEST(IngestResultToHttpTest, UnexpectedErrorsAreInternal) {
  EXPECT_EQ(IngestResultToHttp(absl::InternalError("boom")).status_code, 500);
}

TEST_F(HttpReceiverTest, ServesOverTheNetwork) {
  ASSERT_TRUE(receiver_.Start().ok());
  std::unique_ptr<HttpClient> client = HttpClient::Create();
  const std::string base = absl::StrCat("http://127.0.0.1:", receiver_.port());

  absl::StatusOr<HttpResponse> accepted =
      client->Post(absl::StrCat(base, kTracesPath), kContentTypeProtobuf,
                   SerializedRequest({GetSpanRecord()}), absl::Seconds(5));
  ASSERT_TRUE(accepted.ok()) << accepted.status();
  EXPECT_EQ(accepted->status_code, 200);

  absl::StatusOr<HttpResponse> not_found = client->Post(
      absl::StrCat(base, "/v1/logs"), kContentTypeJson, "{}", absl::Seconds(5));
  ASSERT_TRUE(not_found.ok()) << not_found.status();
  EXPECT_EQ(not_found->status_code, 404);

  receiver_.Stop();
  EXPECT_FALSE(receiver_.IsListening());
}

}  // namespace
}  // namespace telemetry_relay
