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

#include <string>

#include "../error.h"
#include "health.grpc.pb.h"

namespace healthcheck { namespace grpc {

using ServingStatus = ::grpc::health::v1::HealthCheckResponse::ServingStatus;

//
// GrpcStatusUtil
//
class GrpcStatusUtil {
 public:
  static void Create(::grpc::Status* status, const Error& err);
  static ::grpc::StatusCode CodeToStatus(Error::Code code);

  // Category of a failed client call with gRPC status 'code'.
  static Error::Code StatusToCode(::grpc::StatusCode code);

  // The canonical upper-case name of a gRPC status code, e.g.
  // "DEADLINE_EXCEEDED".
  static const char* StatusCodeName(::grpc::StatusCode code);
};

// Name of a serving status as spelled in health.proto.
const std::string& ServingStatusName(ServingStatus status);

// Parse a serving status name (case-insensitive). Return false if 'name'
// is not one of the health.proto names.
bool ParseServingStatus(const std::string& name, ServingStatus* status);

}}  // namespace healthcheck::grpc
