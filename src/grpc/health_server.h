// Copyright 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions
// are met:
//  * Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
//  * Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
//  * Neither the name of NVIDIA CORPORATION nor the names of its
//    contributors may be used to endorse or promote products derived
//    from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS ``AS IS'' AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
// PURPOSE ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT OWNER OR
// CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
// EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
// PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY
// OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//
#pragma once

#include <grpc++/grpc++.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "../common.h"
#include "../error.h"
#include "grpc_utils.h"
#include "handler.h"
#include "health.grpc.pb.h"

namespace healthcheck { namespace grpc {

struct SocketOptions {
  std::string address_{"0.0.0.0"};
  // 0 lets the system pick a free port, see Server::BoundPort().
  int32_t port_{kDefaultExampleServerPort};
};

struct SslOptions {
  // Whether SSL is used for communication
  bool use_ssl_{false};
  // File holding PEM-encoded server certificate
  std::string server_cert_{""};
  // File holding PEM-encoded server key
  std::string server_key_{""};
  // File holding PEM-encoded root certificate
  std::string root_cert_{""};
  // Whether to use Mutual Authentication
  bool use_mutual_auth_{false};
};

struct Options {
  SocketOptions socket_;
  SslOptions ssl_;
  // Delay before each health check response is written.
  uint64_t response_delay_ms_{0};
  // Print a line for every call served.
  bool verbose_{false};
};

// Table of serving statuses shared between the server and its handler.
class StatusTable {
 public:
  void Set(const std::string& service, ServingStatus status);

  // Return false if 'service' was removed or never set.
  bool Clear(const std::string& service);

  // Return false if 'service' is not registered.
  bool Get(const std::string& service, ServingStatus* status) const;

  std::map<std::string, ServingStatus> Snapshot() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, ServingStatus> statuses_;
};

// The async flavor of the generated service for Check only. Watch stays a
// synchronous method and answers UNIMPLEMENTED.
typedef ::grpc::health::v1::Health::WithAsyncMethod_Check<
    ::grpc::health::v1::Health::Service>
    HealthAsyncService;

//
// Server
//
// A gRPC server that serves grpc.health.v1.Health from a table of
// per-service statuses.
//
class Server {
 public:
  static Error Create(const Options& options, std::unique_ptr<Server>* server);

  ~Server();

  Error Start();
  Error Stop();

  // The port actually bound, valid after a successful Start().
  int BoundPort() const { return bound_port_; }
  const std::string& Address() const { return server_addr_; }

  // Set the status reported for 'service'. The empty name is the overall
  // server health. May be called while the server is running.
  void SetServingStatus(const std::string& service, ServingStatus status);

  // Forget 'service' so that checks for it answer NOT_FOUND.
  Error ClearServingStatus(const std::string& service);

  // The current status table, ordered by service name.
  std::map<std::string, ServingStatus> ServingStatuses() const
  {
    return statuses_->Snapshot();
  }

 private:
  Server(const Options& options);

  const Options options_;
  const std::string server_addr_;

  ::grpc::ServerBuilder builder_;
  HealthAsyncService health_service_;

  std::unique_ptr<::grpc::Server> server_;
  std::unique_ptr<::grpc::ServerCompletionQueue> common_cq_;
  std::unique_ptr<HandlerBase> common_handler_;

  std::shared_ptr<StatusTable> statuses_;

  int bound_port_{0};
  bool running_{false};
};

}}  // namespace healthcheck::grpc
