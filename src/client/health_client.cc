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
#include "health_client.h"

#include <chrono>
#include <cmath>
#include <iostream>

namespace healthcheck { namespace client {
namespace {

Error
GetChannel(
    const std::string& url, bool use_ssl, const SslOptions& ssl_options,
    std::shared_ptr<::grpc::Channel>* channel)
{
  ::grpc::ChannelArguments arguments;
  std::shared_ptr<::grpc::ChannelCredentials> credentials;
  if (use_ssl) {
    std::string root;
    std::string key;
    std::string cert;
    RETURN_IF_ERR(ReadFile(ssl_options.root_certificates, &root));
    RETURN_IF_ERR(ReadFile(ssl_options.private_key, &key));
    RETURN_IF_ERR(ReadFile(ssl_options.certificate_chain, &cert));
    ::grpc::SslCredentialsOptions opts = {root, key, cert};
    credentials = ::grpc::SslCredentials(opts);
    if (!ssl_options.target_name_override.empty()) {
      arguments.SetSslTargetNameOverride(ssl_options.target_name_override);
    }
  } else {
    credentials = ::grpc::InsecureChannelCredentials();
  }

  *channel = ::grpc::CreateCustomChannel(url, credentials, arguments);
  if (*channel == nullptr) {
    return Error(
        Error::Code::INVALID_ARG, "unable to create channel to '" + url + "'");
  }
  return Error::Success;
}

}  // namespace

//==============================================================================

Error
HealthGrpcClient::Create(
    std::unique_ptr<HealthGrpcClient>* client, const std::string& server_url,
    bool verbose, bool use_ssl, const SslOptions& ssl_options)
{
  std::shared_ptr<::grpc::Channel> channel;
  RETURN_IF_ERR(GetChannel(server_url, use_ssl, ssl_options, &channel));

  client->reset(new HealthGrpcClient(server_url, verbose, channel));
  return Error::Success;
}

HealthGrpcClient::HealthGrpcClient(
    const std::string& url, bool verbose,
    std::shared_ptr<::grpc::Channel> channel)
    : url_(url), verbose_(verbose), channel_(channel),
      stub_(::grpc::health::v1::Health::NewStub(channel_))
{
}

HealthGrpcClient::~HealthGrpcClient()
{
  // The stub holds a reference to the channel, release it first so that
  // dropping 'channel_' tears the connection down.
  stub_.reset();
  channel_.reset();
}

Error
HealthGrpcClient::Check(
    ServingStatus* status, const std::string& service, double timeout_secs,
    const Headers& headers)
{
  Error err;

  ::grpc::health::v1::HealthCheckRequest request;
  ::grpc::health::v1::HealthCheckResponse response;
  ::grpc::ClientContext context;

  for (const auto& it : headers) {
    context.AddMetadata(it.first, it.second);
  }

  // Convert in double seconds only below the cap, the cast overflows the
  // clock's integer representation otherwise.
  if (std::isfinite(timeout_secs) && (timeout_secs < kMaxTimeoutSecs)) {
    context.set_deadline(
        std::chrono::system_clock::now() +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(timeout_secs)));
  } else {
    context.set_deadline(std::chrono::system_clock::time_point::max());
  }

  request.set_service(service);
  ::grpc::Status grpc_status = stub_->Check(&context, request, &response);
  if (grpc_status.ok()) {
    *status = response.status();
    if (verbose_) {
      const std::string& name = healthcheck::grpc::ServingStatusName(*status);
      switch (*status) {
        case ::grpc::health::v1::HealthCheckResponse::SERVING:
        case ::grpc::health::v1::HealthCheckResponse::NOT_SERVING:
          std::cout << "Service is " << name << std::endl;
          break;
        case ::grpc::health::v1::HealthCheckResponse::UNKNOWN:
          std::cout << "Service status is " << name << std::endl;
          break;
        default:
          std::cout << "Service status: "
                    << (name.empty() ? std::to_string(*status) : name)
                    << std::endl;
          break;
      }
    }
  } else {
    if (verbose_) {
      std::cout << "gRPC Error: "
                << healthcheck::grpc::GrpcStatusUtil::StatusCodeName(
                       grpc_status.error_code())
                << std::endl;
      std::cout << "  Details: " << grpc_status.error_message() << std::endl;
    }
    err = ClassifyFailure(grpc_status, service, timeout_secs);
  }

  return err;
}

Error
HealthGrpcClient::ClassifyFailure(
    const ::grpc::Status& grpc_status, const std::string& service,
    double timeout_secs) const
{
  const int rpc_code = static_cast<int>(grpc_status.error_code());
  const Error::Code code =
      healthcheck::grpc::GrpcStatusUtil::StatusToCode(grpc_status.error_code());
  switch (code) {
    case Error::Code::UNIMPLEMENTED:
      return Error(
          code,
          std::string(
              "Health check not implemented on the server. Make sure the "
              "server implements ") +
              kHealthServiceName + " service.",
          rpc_code);
    case Error::Code::TIMED_OUT:
      return Error(
          code,
          "Health check timed out after " + FormatSeconds(timeout_secs) + "s",
          rpc_code);
    case Error::Code::UNREACHABLE:
      return Error(code, "Cannot connect to " + url_, rpc_code);
    case Error::Code::SERVICE_NOT_FOUND:
      return Error(code, "Service '" + service + "' not found", rpc_code);
    default:
      break;
  }

  return Error(
      Error::Code::OTHER,
      std::string("Health check failed: ") +
          healthcheck::grpc::GrpcStatusUtil::StatusCodeName(
              grpc_status.error_code()) +
          " - " + grpc_status.error_message(),
      rpc_code);
}

}}  // namespace healthcheck::client
