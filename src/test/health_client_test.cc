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
#include "gtest/gtest.h"

#ifdef FAIL
#undef FAIL
#endif

#include <memory>
#include <string>

#include "client/health_client.h"
#include "grpc/health_server.h"
#include "health_test_util.h"

namespace hc = healthcheck;
namespace hcc = healthcheck::client;
namespace hcg = healthcheck::grpc;
using HealthCheckResponse = ::grpc::health::v1::HealthCheckResponse;

namespace {

class HealthClientTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    options_.socket_.address_ = "127.0.0.1";
    options_.socket_.port_ = 0;
  }

  void TearDown() override
  {
    if (server_ != nullptr) {
      hc::Error err = server_->Stop();
      EXPECT_TRUE(err.IsOk()) << err;
    }
  }

  void StartServer()
  {
    hc::Error err = hcg::Server::Create(options_, &server_);
    ASSERT_TRUE(err.IsOk()) << err;
    server_->SetServingStatus("", HealthCheckResponse::SERVING);
    server_->SetServingStatus("example.Service", HealthCheckResponse::SERVING);
    server_->SetServingStatus(
        "example.AnotherService", HealthCheckResponse::NOT_SERVING);
    server_->SetServingStatus("example.Starting", HealthCheckResponse::UNKNOWN);
    err = server_->Start();
    ASSERT_TRUE(err.IsOk()) << err;
    target_ = "127.0.0.1:" + std::to_string(server_->BoundPort());
  }

  void CreateClient(const std::string& target, bool verbose = false)
  {
    hc::Error err = hcc::HealthGrpcClient::Create(&client_, target, verbose);
    ASSERT_TRUE(err.IsOk()) << err;
  }

  hcg::Options options_;
  std::unique_ptr<hcg::Server> server_;
  std::string target_;
  std::unique_ptr<hcc::HealthGrpcClient> client_;
};

TEST_F(HealthClientTest, Serving)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));
  EXPECT_EQ(client_->Url(), target_);

  hcc::ServingStatus status = HealthCheckResponse::UNKNOWN;
  hc::Error err = client_->Check(&status, "");
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(status, HealthCheckResponse::SERVING);

  err = client_->Check(&status, "example.Service", 2.0);
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(status, HealthCheckResponse::SERVING);
}

TEST_F(HealthClientTest, VeryLargeTimeout)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));

  for (const double timeout : {31536000.0, 1e10, 1e300}) {
    hcc::ServingStatus status = HealthCheckResponse::UNKNOWN;
    hc::Error err = client_->Check(&status, "", timeout);
    ASSERT_TRUE(err.IsOk()) << "timeout " << timeout << ": " << err;
    EXPECT_EQ(status, HealthCheckResponse::SERVING);
  }
}

TEST_F(HealthClientTest, NotServingIsNotAnError)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));

  hcc::ServingStatus status = HealthCheckResponse::SERVING;
  hc::Error err = client_->Check(&status, "example.AnotherService");
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(status, HealthCheckResponse::NOT_SERVING);

  err = client_->Check(&status, "example.Starting");
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(status, HealthCheckResponse::UNKNOWN);
}

TEST_F(HealthClientTest, ServiceNotFound)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));

  hcc::ServingStatus status;
  hc::Error err = client_->Check(&status, "myapp.UserService");
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::SERVICE_NOT_FOUND);
  EXPECT_EQ(err.Message(), "Service 'myapp.UserService' not found");
  EXPECT_EQ(err.RpcCode(), static_cast<int>(::grpc::StatusCode::NOT_FOUND));
}

TEST_F(HealthClientTest, TimedOut)
{
  options_.response_delay_ms_ = 1000;
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));

  hcc::ServingStatus status;
  hc::Error err = client_->Check(&status, "", 0.2);
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::TIMED_OUT);
  EXPECT_EQ(err.Message(), "Health check timed out after 0.2s");
}

TEST_F(HealthClientTest, Unreachable)
{
  // Find a port nothing listens on by starting and stopping a server.
  ASSERT_NO_FATAL_FAILURE(StartServer());
  hc::Error err = server_->Stop();
  ASSERT_TRUE(err.IsOk()) << err;
  server_.reset();

  ASSERT_NO_FATAL_FAILURE(CreateClient(target_));
  hcc::ServingStatus status;
  err = client_->Check(&status, "", 2.0);
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::UNREACHABLE);
  EXPECT_EQ(err.Message(), "Cannot connect to " + target_);
}

TEST_F(HealthClientTest, Unimplemented)
{
  hc::test::UnimplementedHealthService service;
  int port = 0;
  auto server = hc::test::StartSyncServer(&service, &port);
  ASSERT_NE(server, nullptr);
  ASSERT_GT(port, 0);

  ASSERT_NO_FATAL_FAILURE(CreateClient("127.0.0.1:" + std::to_string(port)));
  hcc::ServingStatus status;
  hc::Error err = client_->Check(&status, "");
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::UNIMPLEMENTED);
  EXPECT_EQ(
      err.Message(),
      "Health check not implemented on the server. Make sure the server "
      "implements grpc.health.v1.Health service.");

  server->Shutdown();
}

TEST_F(HealthClientTest, OtherFailureKeepsRpcCode)
{
  hc::test::ErrorHealthService service(
      ::grpc::StatusCode::PERMISSION_DENIED, "nope");
  int port = 0;
  auto server = hc::test::StartSyncServer(&service, &port);
  ASSERT_NE(server, nullptr);
  ASSERT_GT(port, 0);

  ASSERT_NO_FATAL_FAILURE(CreateClient("127.0.0.1:" + std::to_string(port)));
  hcc::ServingStatus status;
  hc::Error err = client_->Check(&status, "");
  EXPECT_FALSE(err.IsOk());
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::OTHER);
  EXPECT_EQ(err.Message(), "Health check failed: PERMISSION_DENIED - nope");
  EXPECT_EQ(err.RpcCode(), 7);

  server->Shutdown();
}

TEST_F(HealthClientTest, HeadersAreSent)
{
  hc::test::RecordingHealthService service;
  int port = 0;
  auto server = hc::test::StartSyncServer(&service, &port);
  ASSERT_NE(server, nullptr);

  ASSERT_NO_FATAL_FAILURE(CreateClient("127.0.0.1:" + std::to_string(port)));
  hc::Headers headers{{"authorization", "Bearer abc"}, {"x-request-id", "42"}};
  hcc::ServingStatus status;
  hc::Error err = client_->Check(&status, "myapp.UserService", 5.0, headers);
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(status, HealthCheckResponse::SERVING);
  EXPECT_EQ(service.LastService(), "myapp.UserService");

  const auto metadata = service.Metadata();
  ASSERT_EQ(metadata.count("authorization"), 1u);
  EXPECT_EQ(metadata.at("authorization"), "Bearer abc");
  ASSERT_EQ(metadata.count("x-request-id"), 1u);
  EXPECT_EQ(metadata.at("x-request-id"), "42");

  server->Shutdown();
}

TEST_F(HealthClientTest, VerboseOutput)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  ASSERT_NO_FATAL_FAILURE(CreateClient(target_, true /* verbose */));

  hcc::ServingStatus status;
  ::testing::internal::CaptureStdout();
  hc::Error err = client_->Check(&status, "example.Starting");
  std::string out = ::testing::internal::GetCapturedStdout();
  ASSERT_TRUE(err.IsOk()) << err;
  EXPECT_EQ(out, "Service status is UNKNOWN\n");

  ::testing::internal::CaptureStdout();
  err = client_->Check(&status, "missing");
  out = ::testing::internal::GetCapturedStdout();
  EXPECT_FALSE(err.IsOk());
  EXPECT_NE(out.find("gRPC Error: NOT_FOUND"), std::string::npos);
  EXPECT_NE(out.find("  Details: service name unknown"), std::string::npos);
}

TEST_F(HealthClientTest, UnreadableTlsFile)
{
  hcc::SslOptions ssl_options;
  ssl_options.root_certificates = "/nonexistent/healthcheck/ca.pem";
  hc::Error err = hcc::HealthGrpcClient::Create(
      &client_, "localhost:50051", false, true /* use_ssl */, ssl_options);
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::INVALID_ARG);
  EXPECT_NE(err.Message().find("ca.pem"), std::string::npos);
  EXPECT_EQ(client_, nullptr);
}

TEST_F(HealthClientTest, TlsAgainstPlaintextServer)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());
  hc::Error err = hcc::HealthGrpcClient::Create(
      &client_, target_, false, true /* use_ssl */);
  ASSERT_TRUE(err.IsOk()) << err;

  hcc::ServingStatus status;
  err = client_->Check(&status, "", 2.0);
  EXPECT_FALSE(err.IsOk());
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
