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
#include "error.h"

namespace healthcheck {

const Error Error::Success;

Error::Error(const std::string& msg)
    : code_(msg.empty() ? Code::SUCCESS : Code::OTHER), msg_(msg),
      rpc_code_(-1)
{
}

Error::Error(Code code, const std::string& msg, int rpc_code)
    : code_(code), msg_(msg), rpc_code_(rpc_code)
{
}

const char*
Error::CodeString(Code code)
{
  switch (code) {
    case Code::SUCCESS:
      return "OK";
    case Code::UNREACHABLE:
      return "UNREACHABLE";
    case Code::TIMED_OUT:
      return "TIMED_OUT";
    case Code::UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    case Code::SERVICE_NOT_FOUND:
      return "SERVICE_NOT_FOUND";
    case Code::INVALID_ARG:
      return "INVALID_ARG";
    case Code::UNAVAILABLE:
      return "UNAVAILABLE";
    case Code::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case Code::OTHER:
      return "OTHER";
  }

  return "<invalid code>";
}

std::ostream&
operator<<(std::ostream& out, const Error& err)
{
  if (!err.msg_.empty()) {
    out << err.msg_;
  }
  return out;
}

}  // namespace healthcheck
