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

/// \file

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "../common.h"
#include "../grpc/grpc_utils.h"
#include "health.grpc.pb.h"

namespace healthcheck { namespace client {

using ServingStatus = healthcheck::grpc::ServingStatus;

//==============================================================================
/// SSL/TLS settings for the channel. Empty file paths leave the
/// corresponding setting to the gRPC runtime defaults.
///
struct SslOptions {
  explicit SslOptions() {}
  /// File holding PEM-encoded root certificates. If empty, the default
  /// roots of the gRPC runtime are used.
  std::string root_certificates;
  /// File holding PEM-encoded private key for client authentication.
  std::string private_key;
  /// File holding PEM-encoded certificate chain for client
  /// authentication.
  std::string certificate_chain;
  /// If not empty, the name checked against the server certificate
  /// instead of the host part of the target address.
  std::string target_name_override;
};

//==============================================================================
/// A HealthGrpcClient object checks the health of a gRPC server using the
/// standard grpc.health.v1.Health protocol. The client owns its channel;
/// the connection is released when the client is destroyed.
///
/// \code
///   std::unique_ptr<HealthGrpcClient> client;
///   HealthGrpcClient::Create(&client, "localhost:50051");
///   ServingStatus status;
///   client->Check(&status, "", 5.0);
///   ...
/// \endcode
///
class HealthGrpcClient {
 public:
  ~HealthGrpcClient();

  /// Create a client that can be used to communicate with the server.
  /// \param client Returns a new HealthGrpcClient object.
  /// \param server_url The server name and port.
  /// \param verbose If true generate verbose output when contacting
  /// the server.
  /// \param use_ssl If true use encrypted channel to the server.
  /// \param ssl_options Specifies the files required for
  /// SSL encryption and authorization.
  /// \return Error object indicating success or failure.
  static Error Create(
      std::unique_ptr<HealthGrpcClient>* client, const std::string& server_url,
      bool verbose = false, bool use_ssl = false,
      const SslOptions& ssl_options = SslOptions());

  /// Contact the server and get the serving status of a service.
  /// \param status Returns the serving status reported by the server.
  /// \param service The name of the service to check. An empty string
  /// checks the health of the server as a whole.
  /// \param timeout_secs The deadline of the call, in seconds.
  /// \param headers Optional map specifying additional metadata to
  /// include in the gRPC request.
  /// \return Error object indicating success or failure of the request.
  /// Failures are classified as UNREACHABLE, TIMED_OUT, UNIMPLEMENTED,
  /// SERVICE_NOT_FOUND or OTHER.
  Error Check(
      ServingStatus* status, const std::string& service,
      double timeout_secs = kDefaultTimeoutSecs,
      const Headers& headers = Headers());

  /// The target address this client connects to.
  const std::string& Url() const { return url_; }

 private:
  HealthGrpcClient(
      const std::string& url, bool verbose,
      std::shared_ptr<::grpc::Channel> channel);

  Error ClassifyFailure(
      const ::grpc::Status& grpc_status, const std::string& service,
      double timeout_secs) const;

  const std::string url_;
  // Enable verbose output
  const bool verbose_;
  std::shared_ptr<::grpc::Channel> channel_;
  // GRPC end point.
  std::unique_ptr<::grpc::health::v1::Health::Stub> stub_;
};

}}  // namespace healthcheck::client
