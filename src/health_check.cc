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
#include "health_check.h"

#include <iostream>
#include <memory>

namespace healthcheck {

namespace {

void
PrintBanner(const HealthCheckParameters& params)
{
  std::cout << "Checking health of gRPC server at " << params.target_
            << std::endl;
  std::cout << "  Service: "
            << (params.service_.empty() ? "<overall server health>"
                                        : params.service_)
            << std::endl;
  std::cout << "  Timeout: " << FormatSeconds(params.timeout_secs_) << "s"
            << std::endl;
  std::cout << "  TLS: " << (params.use_tls_ ? "enabled" : "disabled")
            << std::endl;
  std::cout << std::endl;
}

Error
CheckServer(const HealthCheckParameters& params, client::ServingStatus* status)
{
  std::unique_ptr<client::HealthGrpcClient> client;
  RETURN_IF_ERR(client::HealthGrpcClient::Create(
      &client, params.target_, params.verbose_, params.use_tls_,
      params.ssl_options_));
  return client->Check(
      status, params.service_, params.timeout_secs_, params.headers_);
}

}  // namespace

int
RunHealthCheck(const HealthCheckParameters& params)
{
  if (params.verbose_) {
    PrintBanner(params);
  }

  client::ServingStatus status =
      ::grpc::health::v1::HealthCheckResponse::UNKNOWN;
  const Error err = CheckServer(params, &status);
  if (!err.IsOk()) {
    std::cerr << "error: Health check failed: " << err << std::endl;
    return 1;
  }

  const bool healthy =
      (status == ::grpc::health::v1::HealthCheckResponse::SERVING);
  if (!params.verbose_) {
    std::cout << (healthy ? "Service is healthy" : "Service is not healthy")
              << std::endl;
  }

  return healthy ? 0 : 1;
}

}  // namespace healthcheck
