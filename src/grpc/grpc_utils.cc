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
#include "grpc_utils.h"

#include <algorithm>
#include <cctype>

namespace healthcheck { namespace grpc {

void
GrpcStatusUtil::Create(::grpc::Status* status, const Error& err)
{
  if (err.IsOk()) {
    *status = ::grpc::Status::OK;
  } else {
    *status = ::grpc::Status(
        GrpcStatusUtil::CodeToStatus(err.ErrorCode()), err.Message());
  }
}

::grpc::StatusCode
GrpcStatusUtil::CodeToStatus(Error::Code code)
{
  // GRPC status codes:
  // https://github.com/grpc/grpc/blob/master/include/grpc/impl/codegen/status.h
  switch (code) {
    case Error::Code::SUCCESS:
      return ::grpc::StatusCode::OK;
    case Error::Code::UNREACHABLE:
    case Error::Code::UNAVAILABLE:
      return ::grpc::StatusCode::UNAVAILABLE;
    case Error::Code::TIMED_OUT:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case Error::Code::UNIMPLEMENTED:
      return ::grpc::StatusCode::UNIMPLEMENTED;
    case Error::Code::SERVICE_NOT_FOUND:
      return ::grpc::StatusCode::NOT_FOUND;
    case Error::Code::INVALID_ARG:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case Error::Code::ALREADY_EXISTS:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case Error::Code::OTHER:
      return ::grpc::StatusCode::UNKNOWN;
  }

  return ::grpc::StatusCode::UNKNOWN;
}

Error::Code
GrpcStatusUtil::StatusToCode(::grpc::StatusCode code)
{
  switch (code) {
    case ::grpc::StatusCode::OK:
      return Error::Code::SUCCESS;
    case ::grpc::StatusCode::UNAVAILABLE:
      return Error::Code::UNREACHABLE;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return Error::Code::TIMED_OUT;
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return Error::Code::UNIMPLEMENTED;
    case ::grpc::StatusCode::NOT_FOUND:
      return Error::Code::SERVICE_NOT_FOUND;
    default:
      break;
  }

  return Error::Code::OTHER;
}

const char*
GrpcStatusUtil::StatusCodeName(::grpc::StatusCode code)
{
  switch (code) {
    case ::grpc::StatusCode::OK:
      return "OK";
    case ::grpc::StatusCode::CANCELLED:
      return "CANCELLED";
    case ::grpc::StatusCode::UNKNOWN:
      return "UNKNOWN";
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case ::grpc::StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case ::grpc::StatusCode::PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case ::grpc::StatusCode::ABORTED:
      return "ABORTED";
    case ::grpc::StatusCode::OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    case ::grpc::StatusCode::INTERNAL:
      return "INTERNAL";
    case ::grpc::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case ::grpc::StatusCode::DATA_LOSS:
      return "DATA_LOSS";
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return "UNAUTHENTICATED";
    default:
      break;
  }

  return "<invalid code>";
}

const std::string&
ServingStatusName(ServingStatus status)
{
  return ::grpc::health::v1::HealthCheckResponse::ServingStatus_Name(status);
}

bool
ParseServingStatus(const std::string& name, ServingStatus* status)
{
  std::string uname = name;
  std::transform(
      uname.begin(), uname.end(), uname.begin(),
      [](unsigned char c) { return std::toupper(c); });
  return ::grpc::health::v1::HealthCheckResponse::ServingStatus_Parse(
      uname, status);
}

}}  // namespace healthcheck::grpc
