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

#include <chrono>
#include <memory>
#include <string>

#include "grpc/health_server.h"

namespace hcg = healthcheck::grpc;
using healthcheck::Error;
using HealthCheckResponse = ::grpc::health::v1::HealthCheckResponse;

namespace {

class HealthServerTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    options_.socket_.address_ = "127.0.0.1";
    options_.socket_.port_ = 0;
  }

  void StartServer()
  {
    Error err = hcg::Server::Create(options_, &server_);
    ASSERT_TRUE(err.IsOk()) << err;
    server_->SetServingStatus("", HealthCheckResponse::SERVING);
    server_->SetServingStatus("example.Service", HealthCheckResponse::SERVING);
    server_->SetServingStatus(
        "example.AnotherService", HealthCheckResponse::NOT_SERVING);
    err = server_->Start();
    ASSERT_TRUE(err.IsOk()) << err;
    ASSERT_GT(server_->BoundPort(), 0);

    channel_ = ::grpc::CreateChannel(
        "127.0.0.1:" + std::to_string(server_->BoundPort()),
        ::grpc::InsecureChannelCredentials());
    stub_ = ::grpc::health::v1::Health::NewStub(channel_);
  }

  ::grpc::Status Check(
      const std::string& service, HealthCheckResponse* response)
  {
    ::grpc::ClientContext context;
    context.set_deadline(
        std::chrono::system_clock::now() + std::chrono::seconds(5));
    ::grpc::health::v1::HealthCheckRequest request;
    request.set_service(service);
    return stub_->Check(&context, request, response);
  }

  hcg::Options options_;
  std::unique_ptr<hcg::Server> server_;
  std::shared_ptr<::grpc::Channel> channel_;
  std::unique_ptr<::grpc::health::v1::Health::Stub> stub_;
};

TEST_F(HealthServerTest, RegisteredServices)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  HealthCheckResponse response;
  ::grpc::Status status = Check("", &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), HealthCheckResponse::SERVING);

  status = Check("example.Service", &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), HealthCheckResponse::SERVING);

  status = Check("example.AnotherService", &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), HealthCheckResponse::NOT_SERVING);
}

TEST_F(HealthServerTest, UnregisteredService)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  HealthCheckResponse response;
  ::grpc::Status status = Check("no.such.Service", &response);
  EXPECT_EQ(status.error_code(), ::grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(status.error_message(), "service name unknown");
}

TEST_F(HealthServerTest, StatusChangesWhileRunning)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  server_->SetServingStatus("", HealthCheckResponse::NOT_SERVING);
  HealthCheckResponse response;
  ::grpc::Status status = Check("", &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), HealthCheckResponse::NOT_SERVING);

  Error err = server_->ClearServingStatus("example.Service");
  ASSERT_TRUE(err.IsOk()) << err;
  status = Check("example.Service", &response);
  EXPECT_EQ(status.error_code(), ::grpc::StatusCode::NOT_FOUND);

  err = server_->ClearServingStatus("example.Service");
  EXPECT_EQ(err.ErrorCode(), Error::Code::SERVICE_NOT_FOUND);
}

TEST_F(HealthServerTest, WatchIsUnimplemented)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  ::grpc::ClientContext context;
  context.set_deadline(
      std::chrono::system_clock::now() + std::chrono::seconds(5));
  ::grpc::health::v1::HealthCheckRequest request;
  auto reader = stub_->Watch(&context, request);
  HealthCheckResponse response;
  while (reader->Read(&response)) {
  }
  ::grpc::Status status = reader->Finish();
  EXPECT_EQ(status.error_code(), ::grpc::StatusCode::UNIMPLEMENTED);
}

TEST_F(HealthServerTest, ServingStatusesSnapshot)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  const auto statuses = server_->ServingStatuses();
  ASSERT_EQ(statuses.size(), 3u);
  auto it = statuses.begin();
  EXPECT_EQ(it->first, "");
  EXPECT_EQ((++it)->first, "example.AnotherService");
  EXPECT_EQ((++it)->first, "example.Service");
}

TEST_F(HealthServerTest, Lifecycle)
{
  Error err = hcg::Server::Create(options_, &server_);
  ASSERT_TRUE(err.IsOk()) << err;

  err = server_->Stop();
  EXPECT_EQ(err.ErrorCode(), Error::Code::UNAVAILABLE);

  err = server_->Start();
  ASSERT_TRUE(err.IsOk()) << err;
  err = server_->Start();
  EXPECT_EQ(err.ErrorCode(), Error::Code::ALREADY_EXISTS);

  err = server_->Stop();
  EXPECT_TRUE(err.IsOk()) << err;
  err = server_->Stop();
  EXPECT_EQ(err.ErrorCode(), Error::Code::UNAVAILABLE);

  err = server_->Start();
  EXPECT_EQ(err.ErrorCode(), Error::Code::UNAVAILABLE);
}

TEST_F(HealthServerTest, PortInUse)
{
  ASSERT_NO_FATAL_FAILURE(StartServer());

  hcg::Options options = options_;
  options.socket_.port_ = server_->BoundPort();
  std::unique_ptr<hcg::Server> other;
  Error err = hcg::Server::Create(options, &other);
  ASSERT_TRUE(err.IsOk()) << err;
  err = other->Start();
  EXPECT_EQ(err.ErrorCode(), Error::Code::UNAVAILABLE);
  EXPECT_NE(err.Message().find("already in use"), std::string::npos);
}

TEST_F(HealthServerTest, UnreadableCertificate)
{
  options_.ssl_.use_ssl_ = true;
  options_.ssl_.server_cert_ = "/nonexistent/healthcheck/server.pem";
  options_.ssl_.server_key_ = "/nonexistent/healthcheck/server.key";

  Error err = hcg::Server::Create(options_, &server_);
  EXPECT_EQ(err.ErrorCode(), Error::Code::INVALID_ARG);
  EXPECT_NE(err.Message().find("server.pem"), std::string::npos);
  EXPECT_EQ(server_, nullptr);
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
