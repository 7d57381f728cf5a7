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

#include <pthread.h>
#include <signal.h>

#include <memory>
#include <string>
#include <utility>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/flags.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "components/config/config_store.h"
#include "components/config/pipeline_config.h"
#include "components/server/server.h"
#include "components/telemetry/telemetry.h"
#include "components/telemetry/telemetry_provider.h"
#include "components/util/build_info.h"
#include "public/constants.h"

ABSL_FLAG(std::string, config_path, "",
          "Path of the pipeline configuration, in protobuf text format.");
ABSL_FLAG(int, num_workers, 2,
          "Workers per pipeline unless the config sets service.num_workers.");
ABSL_FLAG(absl::Duration, shutdown_grace_period, absl::Seconds(5),
          "Time the relay gets to flush queued telemetry on shutdown.");
ABSL_FLAG(bool, enable_self_telemetry, false,
          "Export the relay's own spans and metrics.");
ABSL_FLAG(absl::Duration, stats_log_interval, absl::Minutes(1),
          "Period of the stats log line. 0 disables it.");
ABSL_FLAG(absl::Duration, self_metrics_interval, absl::Seconds(60),
          "Export period of the relay's own metrics.");
ABSL_FLAG(bool, buildinfo, false, "Print build info.");

namespace {

// Blocks SIGINT and SIGTERM in every thread started after this call, so
// that `WaitForTermination` is the only place receiving them.
sigset_t BlockTerminationSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

void WaitForTermination(const sigset_t& signals) {
  int signal = 0;
  if (const int error = sigwait(&signals, &signal); error != 0) {
    LOG(ERROR) << "sigwait failed with error " << error;
    return;
  }
  LOG(INFO) << "Received signal " << signal;
}

}  // namespace

int main(int argc, char** argv) {
  absl::InitializeSymbolizer(argv[0]);
  {
    absl::FailureSignalHandlerOptions options;
    absl::InstallFailureSignalHandler(options);
  }
  absl::SetProgramUsageMessage(absl::StrCat(
      "Telemetry relay.  Sample usage:\n", argv[0],
      " --config_path=config/relay.textproto"));
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  telemetry_relay::LogBuildInfo();
  if (absl::GetFlag(FLAGS_buildinfo)) {
    return 0;
  }

  const std::string config_path = absl::GetFlag(FLAGS_config_path);
  if (config_path.empty()) {
    LOG(FATAL) << "--config_path is required";
  }
  absl::StatusOr<telemetry_relay::PipelineConfig> config =
      telemetry_relay::LoadPipelineConfig(config_path);
  if (!config.ok()) {
    LOG(FATAL) << "Invalid pipeline config " << config_path << ": "
               << config.status();
  }

  const std::string build_version(telemetry_relay::BuildVersion());
  telemetry_relay::InitTelemetry(std::string(telemetry_relay::kServiceName),
                                 build_version);
  if (absl::GetFlag(FLAGS_enable_self_telemetry)) {
    const auto resource = telemetry_relay::CreateSelfResource(
        std::string(telemetry_relay::kServiceName), build_version);
    telemetry_relay::ConfigureMetrics(
        resource, telemetry_relay::MetricReaderOptions(
                      absl::GetFlag(FLAGS_self_metrics_interval)));
    telemetry_relay::ConfigureTracer(resource);
  }
  std::unique_ptr<telemetry_relay::MetricsRecorder> metrics_recorder =
      telemetry_relay::TelemetryProvider::GetInstance()
          .CreateMetricsRecorder();

  const sigset_t signals = BlockTerminationSignals();
  telemetry_relay::ServerOptions options;
  options.num_workers = absl::GetFlag(FLAGS_num_workers);
  options.shutdown_grace_period = absl::GetFlag(FLAGS_shutdown_grace_period);
  options.stats_log_interval = absl::GetFlag(FLAGS_stats_log_interval);
  telemetry_relay::Server server(
      std::make_unique<telemetry_relay::ConfigStore>(*std::move(config),
                                                     config_path),
      *metrics_recorder, options);
  if (const absl::Status status = server.Init(); !status.ok()) {
    LOG(FATAL) << "Failed to start the relay: " << status;
  }
  WaitForTermination(signals);
  server.GracefulShutdown();
  return 0;
}
