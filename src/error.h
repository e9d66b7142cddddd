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

#include <iostream>
#include <string>

namespace healthcheck {

//==============================================================================
/// Error status reported by the health check client and example server.
///
class Error {
 public:
  /// The category of an error. The categories mirror the ways a single
  /// health check can fail.
  enum class Code {
    SUCCESS,
    // The server could not be reached (connection refused, DNS failure).
    UNREACHABLE,
    // No response arrived before the deadline.
    TIMED_OUT,
    // The server does not implement grpc.health.v1.Health.
    UNIMPLEMENTED,
    // The server does not know the requested service.
    SERVICE_NOT_FOUND,
    // Invalid option, option combination or input file.
    INVALID_ARG,
    // The requested resource (e.g. a listening socket) is not available.
    UNAVAILABLE,
    // An operation was requested in the wrong state.
    ALREADY_EXISTS,
    // Any other RPC failure. RpcCode() holds the gRPC status code.
    OTHER
  };

  /// Create an error with the specified message. A non-empty message
  /// without an explicit code is reported as Code::OTHER.
  /// \param msg The message for the error
  explicit Error(const std::string& msg = "");

  /// Create an error with the specified code and message.
  /// \param code The category of the error.
  /// \param msg The message for the error.
  /// \param rpc_code The gRPC status code that produced the error, or -1
  /// if the error did not come from an RPC.
  Error(Code code, const std::string& msg, int rpc_code = -1);

  /// Accessor for the message of this error.
  /// \return The messsage for the error. Empty if no error.
  const std::string& Message() const { return msg_; }

  /// Accessor for the category of this error.
  Code ErrorCode() const { return code_; }

  /// The gRPC status code the error was classified from, -1 if none.
  int RpcCode() const { return rpc_code_; }

  /// Does this error indicate OK status?
  /// \return True if this error indicates "ok"/"success", false if
  /// error indicates a failure.
  bool IsOk() const { return code_ == Code::SUCCESS; }

  /// Convenience "success" value. Can be used as Error::Success to
  /// indicate no error.
  static const Error Success;

  /// Readable name of an error category, e.g. "TIMED_OUT".
  static const char* CodeString(Code code);

 private:
  friend std::ostream& operator<<(std::ostream&, const Error&);
  Code code_;
  std::string msg_;
  int rpc_code_;
};

}  // namespace healthcheck
