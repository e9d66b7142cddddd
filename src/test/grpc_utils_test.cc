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

#include <string>

#include "common.h"
#include "grpc/grpc_utils.h"

namespace hc = healthcheck;
namespace hcg = healthcheck::grpc;

namespace {

TEST(GrpcStatusUtilTest, StatusToCode)
{
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(::grpc::StatusCode::OK),
      hc::Error::Code::SUCCESS);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(::grpc::StatusCode::UNAVAILABLE),
      hc::Error::Code::UNREACHABLE);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(
          ::grpc::StatusCode::DEADLINE_EXCEEDED),
      hc::Error::Code::TIMED_OUT);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(::grpc::StatusCode::UNIMPLEMENTED),
      hc::Error::Code::UNIMPLEMENTED);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(::grpc::StatusCode::NOT_FOUND),
      hc::Error::Code::SERVICE_NOT_FOUND);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(
          ::grpc::StatusCode::PERMISSION_DENIED),
      hc::Error::Code::OTHER);
  EXPECT_EQ(
      hcg::GrpcStatusUtil::StatusToCode(::grpc::StatusCode::INTERNAL),
      hc::Error::Code::OTHER);
}

TEST(GrpcStatusUtilTest, CreateStatus)
{
  ::grpc::Status status;
  hcg::GrpcStatusUtil::Create(&status, hc::Error::Success);
  EXPECT_TRUE(status.ok());

  hcg::GrpcStatusUtil::Create(
      &status,
      hc::Error(hc::Error::Code::SERVICE_NOT_FOUND, "service name unknown"));
  EXPECT_EQ(status.error_code(), ::grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(status.error_message(), "service name unknown");

  hcg::GrpcStatusUtil::Create(&status, hc::Error("boom"));
  EXPECT_EQ(status.error_code(), ::grpc::StatusCode::UNKNOWN);
}

TEST(GrpcStatusUtilTest, StatusCodeName)
{
  EXPECT_STREQ(
      hcg::GrpcStatusUtil::StatusCodeName(
          ::grpc::StatusCode::DEADLINE_EXCEEDED),
      "DEADLINE_EXCEEDED");
  EXPECT_STREQ(
      hcg::GrpcStatusUtil::StatusCodeName(
          ::grpc::StatusCode::PERMISSION_DENIED),
      "PERMISSION_DENIED");
  EXPECT_STREQ(
      hcg::GrpcStatusUtil::StatusCodeName(
          static_cast<::grpc::StatusCode>(1234)),
      "<invalid code>");
}

TEST(ServingStatusTest, Names)
{
  EXPECT_EQ(
      hcg::ServingStatusName(::grpc::health::v1::HealthCheckResponse::SERVING),
      "SERVING");
  EXPECT_EQ(
      hcg::ServingStatusName(
          ::grpc::health::v1::HealthCheckResponse::SERVICE_UNKNOWN),
      "SERVICE_UNKNOWN");

  hcg::ServingStatus status;
  ASSERT_TRUE(hcg::ParseServingStatus("not_serving", &status));
  EXPECT_EQ(status, ::grpc::health::v1::HealthCheckResponse::NOT_SERVING);
  ASSERT_TRUE(hcg::ParseServingStatus("UNKNOWN", &status));
  EXPECT_EQ(status, ::grpc::health::v1::HealthCheckResponse::UNKNOWN);
  EXPECT_FALSE(hcg::ParseServingStatus("HEALTHY", &status));
  EXPECT_FALSE(hcg::ParseServingStatus("", &status));
}

TEST(CommonTest, JoinHostPort)
{
  EXPECT_EQ(hc::JoinHostPort("localhost", 50051), "localhost:50051");
  EXPECT_EQ(hc::JoinHostPort("10.0.0.1", 80), "10.0.0.1:80");
  EXPECT_EQ(hc::JoinHostPort("::1", 80), "[::1]:80");
  EXPECT_EQ(hc::JoinHostPort("[fe80::1]", 80), "[fe80::1]:80");
}

TEST(CommonTest, FormatSeconds)
{
  EXPECT_EQ(hc::FormatSeconds(5.0), "5");
  EXPECT_EQ(hc::FormatSeconds(0.25), "0.25");
  EXPECT_EQ(hc::FormatSeconds(10), "10");
}

TEST(CommonTest, ReadFile)
{
  std::string data = "stale";
  EXPECT_TRUE(hc::ReadFile("", &data).IsOk());
  EXPECT_TRUE(data.empty());

  hc::Error err = hc::ReadFile("/nonexistent/healthcheck/ca.pem", &data);
  EXPECT_EQ(err.ErrorCode(), hc::Error::Code::INVALID_ARG);
  EXPECT_NE(err.Message().find("unable to read file"), std::string::npos);
}

}  // namespace

int
main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
