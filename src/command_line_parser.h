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

#include <getopt.h>
#include <unistd.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "client/health_client.h"
#include "common.h"

namespace healthcheck {

// Command-line options
struct Option {
  static constexpr const char* ArgNone = "";
  static constexpr const char* ArgBool = "boolean";
  static constexpr const char* ArgFloat = "float";
  static constexpr const char* ArgInt = "integer";
  static constexpr const char* ArgStr = "string";

  Option(
      int id, std::string flag, std::string arg_desc, std::string desc,
      char short_flag = 0)
      : id_(id), flag_(flag), arg_desc_(arg_desc), desc_(desc),
        short_flag_(short_flag)
  {
  }

  struct option GetLongOption() const
  {
    struct option lo {
      flag_.c_str(), (!arg_desc_.empty()) ? required_argument : no_argument,
          nullptr, id_
    };
    return lo;
  }

  const int id_;
  const std::string flag_;
  const std::string arg_desc_;
  const std::string desc_;
  // Single character alias, 0 if none.
  const char short_flag_;
};

struct HealthCheckParameters {
  // The address actually dialed. Equal to '--target' if given, otherwise
  // assembled from '--host' and '--port'.
  std::string target_{};
  std::string host_{};
  int32_t port_{0};
  std::string service_{};
  double timeout_secs_{kDefaultTimeoutSecs};
  bool use_tls_{false};
  client::SslOptions ssl_options_;
  Headers headers_{};
  bool verbose_{false};
  bool help_{false};
};

// Exception type to be thrown if the error is parsing related
class ParseException : public std::exception {
 public:
  ParseException() = default;
  ParseException(const std::string& message) : message_(message) {}

  virtual const char* what() const throw() { return message_.c_str(); }

 private:
  const std::string message_{""};
};

// Convert an option argument into 'T'. Raise ParseException if the
// value is malformed or out of range for the type.
template <typename T>
T ParseOption(const std::string& arg);

template <>
int ParseOption(const std::string& arg);
template <>
uint64_t ParseOption(const std::string& arg);
template <>
double ParseOption(const std::string& arg);
template <>
bool ParseOption(const std::string& arg);

// Common option table handling. Derived parsers register their options
// into 'option_groups_' and drive getopt_long with the table built by
// LongOptions() and ShortOptions().
class ParserBase {
 public:
  virtual ~ParserBase() = default;

  // Return usage of all recognized options
  std::string Usage();

 protected:
  std::vector<struct option> LongOptions() const;
  std::string ShortOptions() const;

  // Sum of option groups: vector to maintain insertion order for Usage()
  std::vector<std::pair<std::string, std::vector<Option>&>> option_groups_;

 private:
  std::string FormatUsageMessage(std::string str, int offset);
};

// Parser of the 'grpc-healthcheck' command line.
class HealthCheckParser : public ParserBase {
 public:
  HealthCheckParser();

  // Parse command line arguments into a parameters struct. Raise
  // ParseException if an option is unknown, malformed or conflicts with
  // another option. No network activity happens during parsing.
  HealthCheckParameters Parse(int argc, char** argv);

 private:
  // Split a 'Name:Value' header and validate the name as a gRPC metadata
  // key. The name is lower-cased.
  std::pair<std::string, std::string> ParseHeaderOption(
      const std::string& arg);

  // Initialize individual option groups
  void SetupOptions();
  // Initialize option group mappings
  void SetupOptionGroups();

  std::vector<Option> global_options_;
  std::vector<Option> connection_options_;
  std::vector<Option> check_options_;
  std::vector<Option> tls_options_;
};

}  // namespace healthcheck
