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

#include "components/exporters/grpc_exporter.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "public/test_util/proto_matcher.h"
#include "public/test_util/telemetry_record.h"

namespace telemetry_relay {
namespace {

using config::v1::ExporterConfig;

class FakeIngestService : public v1::TelemetryIngestService::Service {
 public:
  grpc::Status Export(grpc::ServerContext* context,
                      const v1::ExportRequest* request,
                      v1::ExportResponse* response) override {
    absl::MutexLock lock(&mutex_);
    requests_.push_back(*request);
    response->set_accepted_records(request->records_size());
    return status_;
  }

  void set_status(grpc::Status status) {
    absl::MutexLock lock(&mutex_);
    status_ = std::move(status);
  }

  std::vector<v1::ExportRequest> requests() {
    absl::MutexLock lock(&mutex_);
    return requests_;
  }

 private:
  absl::Mutex mutex_;
  grpc::Status status_ ABSL_GUARDED_BY(mutex_);
  std::vector<v1::ExportRequest> requests_ ABSL_GUARDED_BY(mutex_);
};

class GrpcExporterTest : public ::testing::Test {
 protected:
  GrpcExporterTest() {
    config_.set_name("downstream");
    config_.set_protocol(ExporterConfig::PROTOCOL_GRPC);
    config_.set_endpoint("relay-2:4317");
    grpc::ServerBuilder builder;
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    exporter_ = std::make_unique<GrpcExporter>(
        [this] { return config_; },
        server_->InProcessChannel(grpc::ChannelArguments()));
  }

  ~GrpcExporterTest() {
    server_->Shutdown();
    server_->Wait();
  }

  ExporterConfig config_;
  FakeIngestService service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<GrpcExporter> exporter_;
};

TEST_F(GrpcExporterTest, ForwardsBatch) {
  const TelemetryBatch batch(
      std::vector<v1::Record>{GetSpanRecord(), GetGaugeRecord()});

  ASSERT_TRUE(exporter_->Export(batch).ok());

  const std::vector<v1::ExportRequest> requests = service_.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_THAT(requests[0], EqualsProto(batch.ToRequest()));
}

TEST_F(GrpcExporterTest, KeepsDownstreamStatusCode) {
  service_.set_status(
      grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, "memory limited"));

  const absl::Status status = exporter_->Export(
      TelemetryBatch(std::vector<v1::Record>{GetSpanRecord()}));

  EXPECT_TRUE(absl::IsResourceExhausted(status));
  EXPECT_EQ(status.message(), "memory limited");
}

TEST(GrpcExporterConnectivityTest, UnreachableEndpointIsUnavailable) {
  ExporterConfig config;
  config.set_endpoint("127.0.0.1:1");
  config.set_timeout_ms(200);
  std::unique_ptr<GrpcExporter> exporter =
      GrpcExporter::Create([config] { return config; });

  EXPECT_TRUE(absl::IsUnavailable(exporter->CheckConnectivity()));
}

}  // namespace
}  // namespace telemetry_relay
