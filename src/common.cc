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
#include "common.h"

#include <fstream>
#include <sstream>

namespace healthcheck {

Error
ReadFile(const std::string& filename, std::string* data)
{
  data->clear();
  if (filename.empty()) {
    return Error::Success;
  }

  std::ifstream file(filename.c_str(), std::ios::in);
  if (!file.is_open()) {
    return Error(
        Error::Code::INVALID_ARG, "unable to read file '" + filename + "'");
  }

  std::stringstream ss;
  ss << file.rdbuf();
  file.close();
  *data = ss.str();
  return Error::Success;
}

std::string
JoinHostPort(const std::string& host, int port)
{
  const bool is_ipv6_literal =
      (host.find(':') != std::string::npos) &&
      !(host.size() >= 2 && host.front() == '[' && host.back() == ']');
  if (is_ipv6_literal) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::string
FormatSeconds(double secs)
{
  std::stringstream ss;
  ss << secs;
  return ss.str();
}

}  // namespace healthcheck
