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

#include <string>
#include <utility>
#include <vector>

#include "command_line_parser.h"
#include "grpc/health_server.h"

namespace healthcheck {

struct ExampleServerParameters {
  grpc::Options grpc_options_;
  // Service name and status pairs, applied in order. Later entries for
  // the same service override earlier ones.
  std::vector<std::pair<std::string, grpc::ServingStatus>> statuses_;
  bool help_{false};
};

// Parser of the 'example_server' command line.
class ExampleServerParser : public ParserBase {
 public:
  ExampleServerParser();

  ExampleServerParameters Parse(int argc, char** argv);

 private:
  std::pair<std::string, grpc::ServingStatus> ParseStatusOption(
      const std::string& arg);

  void SetupOptions();
  void SetupOptionGroups();

  std::vector<Option> global_options_;
  std::vector<Option> server_options_;
  std::vector<Option> health_options_;
  std::vector<Option> tls_options_;
};

}  // namespace healthcheck
