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

#ifndef COMPONENTS_HTTP_HTTP_SERVER_H_
#define COMPONENTS_HTTP_HTTP_SERVER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <thread>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "components/http/http_message.h"
#include "public/constants.h"

namespace telemetry_relay {

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

struct HttpServerOptions {
  // Larger bodies are answered with 413 without being read.
  uint64_t max_body_bytes = kDefaultMaxRequestBytes;
  // Per socket read and write.
  absl::Duration io_timeout = absl::Seconds(10);
};

// Minimal HTTP/1.1 listener: one thread accepts connections and every
// connection is served on its own thread. Each connection carries exactly one
// request; the response always closes it.
class HttpServer {
 public:
  HttpServer(std::string name, HttpHandler handler,
             HttpServerOptions options = HttpServerOptions());
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds `endpoint` ("host:port", port 0 picks a free one) and starts
  // accepting. Returns once the socket listens.
  absl::Status Start(absl::string_view endpoint);

  // Stops accepting, interrupts open connections and joins every thread.
  void Stop();

  bool IsListening() const { return listening_; }
  // Bound port, valid after a successful `Start`.
  uint16_t port() const { return port_; }
  const std::string& name() const { return name_; }

 private:
  struct Connection {
    int fd = -1;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop();
  void Serve(Connection* connection);
  HttpResponse ReadAndHandle(int fd);
  // Joins connections whose thread finished.
  void ReapConnections() ABSL_EXCLUSIVE_LOCKS_REQUIRED(connections_mutex_);

  const std::string name_;
  const HttpHandler handler_;
  const HttpServerOptions options_;

  int listener_fd_ = -1;
  uint16_t port_ = 0;
  std::atomic<bool> listening_{false};
  std::atomic<bool> stopping_{false};
  std::thread accept_thread_;

  absl::Mutex connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_
      ABSL_GUARDED_BY(connections_mutex_);
};

}  // namespace telemetry_relay

#endif  // COMPONENTS_HTTP_HTTP_SERVER_H_
