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
#include <iostream>
#include <memory>

#include "common.h"
#include "example_server_parser.h"
#include "grpc/health_server.h"
#include "healthcheck_signal.h"

namespace {

void
ApplyStatuses(
    const healthcheck::ExampleServerParameters& params,
    healthcheck::grpc::Server* server)
{
  if (params.statuses_.empty()) {
    server->SetServingStatus(
        "", ::grpc::health::v1::HealthCheckResponse::SERVING);
    server->SetServingStatus(
        "example.Service", ::grpc::health::v1::HealthCheckResponse::SERVING);
    server->SetServingStatus(
        "example.AnotherService",
        ::grpc::health::v1::HealthCheckResponse::NOT_SERVING);
    return;
  }

  for (const auto& entry : params.statuses_) {
    server->SetServingStatus(entry.first, entry.second);
  }
}

void
PrintStartup(const healthcheck::grpc::Server& server)
{
  const int port = server.BoundPort();
  const auto statuses = server.ServingStatuses();

  std::cout << "Example gRPC server started on port " << port << std::endl;
  for (const auto& entry : statuses) {
    std::cout << "  "
              << (entry.first.empty() ? "Overall health" : entry.first) << ": "
              << healthcheck::grpc::ServingStatusName(entry.second)
              << std::endl;
  }

  std::cout << std::endl << "Test with:" << std::endl;
  const std::string target = "localhost:" + std::to_string(port);
  for (const auto& entry : statuses) {
    std::cout << "  grpc-healthcheck --target " << target;
    if (!entry.first.empty()) {
      std::cout << " --service " << entry.first;
    }
    std::cout << std::endl;
  }
  std::cout << std::endl << "Press Ctrl+C to stop" << std::endl;
}

}  // namespace

int
main(int argc, char** argv)
{
  healthcheck::ExampleServerParser parser;
  healthcheck::ExampleServerParameters params;
  try {
    params = parser.Parse(argc, argv);
  }
  catch (const healthcheck::ParseException& pe) {
    std::cerr << pe.what() << std::endl;
    std::cerr << "Usage: example_server [options]" << std::endl;
    std::cerr << parser.Usage() << std::endl;
    exit(1);
  }

  if (params.help_) {
    std::cout << "Usage: example_server [options]" << std::endl;
    std::cout << parser.Usage() << std::endl;
    return 0;
  }

  FAIL_IF_ERR(
      healthcheck::RegisterSignalHandler(),
      "failed to register signal handler");

  std::unique_ptr<healthcheck::grpc::Server> server;
  FAIL_IF_ERR(
      healthcheck::grpc::Server::Create(params.grpc_options_, &server),
      "failed to create gRPC health server");
  ApplyStatuses(params, server.get());
  FAIL_IF_ERR(server->Start(), "failed to start gRPC health server");

  PrintStartup(*server);

  // Wait until a signal terminates the server...
  healthcheck::WaitForExitSignal();

  std::cout << std::endl << "Shutting down..." << std::endl;
  FAIL_IF_ERR(server->Stop(), "failed to stop gRPC health server");

  return 0;
}
