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

#include "components/http/http_server.h"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "components/util/host_port.h"

namespace telemetry_relay {
namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;
constexpr size_t kReadChunkBytes = 16 * 1024;

enum class ReadResult { kOk, kClosed, kTimeout, kError };

ReadResult ReadSome(int fd, std::string& buffer) {
  char chunk[kReadChunkBytes];
  while (true) {
    const ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
    if (n > 0) {
      buffer.append(chunk, static_cast<size_t>(n));
      return ReadResult::kOk;
    }
    if (n == 0) {
      return ReadResult::kClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK ? ReadResult::kTimeout
                                                   : ReadResult::kError;
  }
}

bool WriteAll(int fd, absl::string_view data) {
  while (!data.empty()) {
    const ssize_t n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<size_t>(n));
  }
  return true;
}

void SetIoTimeout(int fd, absl::Duration timeout) {
  const timeval tv = absl::ToTimeval(timeout);
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

}  // namespace

HttpServer::HttpServer(std::string name, HttpHandler handler,
                       HttpServerOptions options)
    : name_(std::move(name)),
      handler_(std::move(handler)),
      options_(options) {}

HttpServer::~HttpServer() { Stop(); }

absl::Status HttpServer::Start(absl::string_view endpoint) {
  absl::StatusOr<HostPort> host_port = ParseHostPort(endpoint);
  if (!host_port.ok()) {
    return host_port.status();
  }
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo* addresses = nullptr;
  const std::string port = absl::StrCat(host_port->port);
  if (const int error = getaddrinfo(
          host_port->host.empty() ? nullptr : host_port->host.c_str(),
          port.c_str(), &hints, &addresses);
      error != 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        name_, ": cannot resolve ", endpoint, ": ", gai_strerror(error)));
  }
  int fd = -1;
  int bind_errno = 0;
  for (addrinfo* address = addresses; address != nullptr;
       address = address->ai_next) {
    fd = socket(address->ai_family, address->ai_socktype, address->ai_protocol);
    if (fd < 0) {
      bind_errno = errno;
      continue;
    }
    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (bind(fd, address->ai_addr, address->ai_addrlen) == 0) {
      break;
    }
    bind_errno = errno;
    close(fd);
    fd = -1;
  }
  freeaddrinfo(addresses);
  if (fd < 0) {
    return absl::UnavailableError(absl::StrCat(
        name_, ": cannot bind ", endpoint, ": ", strerror(bind_errno)));
  }
  if (listen(fd, SOMAXCONN) < 0) {
    const int listen_errno = errno;
    close(fd);
    return absl::UnavailableError(absl::StrCat(
        name_, ": cannot listen on ", endpoint, ": ", strerror(listen_errno)));
  }
  sockaddr_storage bound;
  socklen_t bound_size = sizeof(bound);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_size) == 0) {
    port_ = ntohs(bound.ss_family == AF_INET6
                      ? reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port
                      : reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
  }
  listener_fd_ = fd;
  listening_ = true;
  accept_thread_ = std::thread(&HttpServer::AcceptLoop, this);
  LOG(INFO) << name_ << " listening on " << endpoint << " (port " << port_
            << ")";
  return absl::OkStatus();
}

void HttpServer::Stop() {
  if (stopping_.exchange(true)) {
    return;
  }
  if (listener_fd_ >= 0) {
    shutdown(listener_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listener_fd_ >= 0) {
    close(listener_fd_);
    listener_fd_ = -1;
  }
  std::list<std::unique_ptr<Connection>> connections;
  {
    absl::MutexLock lock(&connections_mutex_);
    connections.swap(connections_);
  }
  for (auto& connection : connections) {
    shutdown(connection->fd, SHUT_RDWR);
    connection->thread.join();
    close(connection->fd);
  }
  listening_ = false;
  LOG(INFO) << name_ << " stopped";
}

void HttpServer::AcceptLoop() {
  while (!stopping_) {
    const int fd = accept(listener_fd_, nullptr, nullptr);
    if (fd < 0) {
      if (stopping_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      LOG_EVERY_N_SEC(ERROR, 10)
          << name_ << ": accept failed: " << strerror(errno);
      // Typically out of descriptors; give open connections time to finish.
      absl::SleepFor(absl::Milliseconds(50));
      continue;
    }
    SetIoTimeout(fd, options_.io_timeout);
    absl::MutexLock lock(&connections_mutex_);
    ReapConnections();
    connections_.push_back(std::make_unique<Connection>());
    Connection* connection = connections_.back().get();
    connection->fd = fd;
    connection->thread = std::thread(&HttpServer::Serve, this, connection);
  }
  listening_ = false;
}

void HttpServer::ReapConnections() {
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (!(*it)->done) {
      ++it;
      continue;
    }
    (*it)->thread.join();
    close((*it)->fd);
    it = connections_.erase(it);
  }
}

void HttpServer::Serve(Connection* connection) {
  const HttpResponse response = ReadAndHandle(connection->fd);
  if (!WriteAll(connection->fd, SerializeResponse(response))) {
    VLOG(1) << name_ << ": client went away before the response was sent";
  }
  shutdown(connection->fd, SHUT_RDWR);
  connection->done = true;
}

HttpResponse HttpServer::ReadAndHandle(int fd) {
  std::string buffer;
  size_t head_end = std::string::npos;
  while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
    if (buffer.size() > kMaxHeadBytes) {
      return TextResponse(400, "request head too large\n");
    }
    switch (ReadSome(fd, buffer)) {
      case ReadResult::kOk:
        continue;
      case ReadResult::kTimeout:
        return TextResponse(408, "timed out reading the request\n");
      case ReadResult::kClosed:
      case ReadResult::kError:
        return TextResponse(400, "incomplete request\n");
    }
  }
  absl::StatusOr<HttpRequest> request =
      ParseRequestHead(absl::string_view(buffer).substr(0, head_end));
  if (!request.ok()) {
    return TextResponse(400, absl::StrCat(request.status().message(), "\n"));
  }
  uint64_t content_length = 0;
  if (absl::string_view length = request->Header("content-length");
      !length.empty()) {
    if (!absl::SimpleAtoi(length, &content_length)) {
      return TextResponse(400, "invalid Content-Length\n");
    }
  } else if (!request->Header("transfer-encoding").empty() ||
             request->method == "POST" || request->method == "PUT") {
    return TextResponse(411, "Content-Length is required\n");
  }
  if (content_length > options_.max_body_bytes) {
    return TextResponse(413, absl::StrCat("body exceeds ",
                                          options_.max_body_bytes, " bytes\n"));
  }
  request->body = buffer.substr(head_end + 4);
  while (request->body.size() < content_length) {
    switch (ReadSome(fd, request->body)) {
      case ReadResult::kOk:
        continue;
      case ReadResult::kTimeout:
        return TextResponse(408, "timed out reading the body\n");
      case ReadResult::kClosed:
      case ReadResult::kError:
        return TextResponse(400, "truncated body\n");
    }
  }
  request->body.resize(content_length);
  return handler_(*request);
}

}  // namespace telemetry_relay
