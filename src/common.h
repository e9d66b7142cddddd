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

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

#include "error.h"

namespace healthcheck {

/// Fully-qualified name of the standard health service.
constexpr char kHealthServiceName[] = "grpc.health.v1.Health";

/// Default deadline of a single health check, in seconds.
constexpr double kDefaultTimeoutSecs = 5.0;

/// Largest accepted health check deadline, in seconds (365 days). Longer
/// deadlines are treated as no deadline at all.
constexpr double kMaxTimeoutSecs = 365.0 * 24 * 60 * 60;

/// Port the example server listens on unless told otherwise.
constexpr int kDefaultExampleServerPort = 50051;

/// The key-value map type to be included in the request metadata.
typedef std::map<std::string, std::string> Headers;

#define RETURN_IF_ERR(X)                  \
  do {                                    \
    const healthcheck::Error err__ = (X); \
    if (!err__.IsOk()) {                  \
      return err__;                       \
    }                                     \
  } while (false)

#define RETURN_MSG_IF_ERR(X, MSG)                                       \
  do {                                                                  \
    const healthcheck::Error err__ = (X);                               \
    if (!err__.IsOk()) {                                                \
      return healthcheck::Error(                                        \
          err__.ErrorCode(), std::string(MSG) + ": " + err__.Message(), \
          err__.RpcCode());                                             \
    }                                                                   \
  } while (false)

#define FAIL(MSG)                                 \
  do {                                            \
    std::cerr << "error: " << (MSG) << std::endl; \
    exit(1);                                      \
  } while (false)

#define FAIL_IF_ERR(X, MSG)                                          \
  do {                                                               \
    const healthcheck::Error err__ = (X);                            \
    if (!err__.IsOk()) {                                             \
      std::cerr << "error: " << (MSG) << ": "                        \
                << healthcheck::Error::CodeString(err__.ErrorCode()) \
                << " - " << err__.Message() << std::endl;            \
      exit(1);                                                       \
    }                                                                \
  } while (false)

#define IGNORE_ERR(X)                     \
  do {                                    \
    const healthcheck::Error err__ = (X); \
    (void)err__;                          \
  } while (false)

/// Read the whole content of 'filename' into 'data'. An empty filename
/// yields empty content.
Error ReadFile(const std::string& filename, std::string* data);

/// Join a host and a port into a gRPC target address. An IPv6 literal
/// host is wrapped in brackets unless it already is.
std::string JoinHostPort(const std::string& host, int port);

/// Format a duration in seconds the way it is shown to users, e.g. "5"
/// or "0.25".
std::string FormatSeconds(double secs);

}  // namespace healthcheck
