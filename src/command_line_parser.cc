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
#include "command_line_parser.h"

#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

constexpr const char* GLOBAL_OPTION_GROUP = "";

namespace healthcheck {

namespace {

// A wrapper around std::stoi, std::stoull, std::stod
// to catch `invalid argument` and `out of range` exceptions. Trailing
// characters are rejected (i.e. "1.4" is not a valid 'int').
template <typename T>
T StringTo(const std::string& arg);

template <>
int
StringTo(const std::string& arg)
{
  size_t idx = 0;
  int value = std::stoi(arg, &idx);
  if (idx != arg.size()) {
    throw std::invalid_argument(arg);
  }
  return value;
}

template <>
uint64_t
StringTo(const std::string& arg)
{
  // std::stoull silently wraps negative values
  if (arg.find('-') != std::string::npos) {
    throw std::invalid_argument(arg);
  }
  size_t idx = 0;
  uint64_t value = std::stoull(arg, &idx);
  if (idx != arg.size()) {
    throw std::invalid_argument(arg);
  }
  return value;
}

template <>
double
StringTo(const std::string& arg)
{
  size_t idx = 0;
  double value = std::stod(arg, &idx);
  if (idx != arg.size()) {
    throw std::invalid_argument(arg);
  }
  return value;
}

template <typename T>
T
ParseNumericOption(const std::string& arg)
{
  try {
    return StringTo<T>(arg);
  }
  catch (const std::invalid_argument& ia) {
    std::stringstream ss;
    ss << "Invalid option value. Got " << arg << std::endl;
    throw ParseException(ss.str());
  }
  catch (const std::out_of_range& oor) {
    std::stringstream ss;
    ss << "Provided option value is out of bound. Got " << arg << std::endl;
    throw ParseException(ss.str());
  }
}

}  // namespace

template <>
int
ParseOption(const std::string& arg)
{
  return ParseNumericOption<int>(arg);
}

template <>
uint64_t
ParseOption(const std::string& arg)
{
  return ParseNumericOption<uint64_t>(arg);
}

template <>
double
ParseOption(const std::string& arg)
{
  return ParseNumericOption<double>(arg);
}

template <>
bool
ParseOption(const std::string& arg)
{
  // 'arg' need to comply with template declaration
  std::string larg = arg;
  std::transform(larg.begin(), larg.end(), larg.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  if ((larg == "true") || (larg == "on") || (larg == "1")) {
    return true;
  }
  if ((larg == "false") || (larg == "off") || (larg == "0")) {
    return false;
  }

  throw ParseException("invalid value for bool option: " + arg);
}

enum HealthCheckOptionId {
  OPTION_HELP = 1000,
  OPTION_VERBOSE,
  OPTION_TARGET,
  OPTION_HOST,
  OPTION_PORT,
  OPTION_SERVICE,
  OPTION_TIMEOUT,
  OPTION_HEADER,
  OPTION_TLS,
  OPTION_TLS_CA_CERT,
  OPTION_TLS_CLIENT_CERT,
  OPTION_TLS_CLIENT_KEY,
  OPTION_TLS_SERVER_NAME,
};

//
// ParserBase
//
std::vector<struct option>
ParserBase::LongOptions() const
{
  std::vector<struct option> long_options;
  for (const auto& group : option_groups_) {
    for (const auto& o : group.second) {
      long_options.push_back(o.GetLongOption());
    }
  }
  long_options.push_back({nullptr, 0, nullptr, 0});
  return long_options;
}

std::string
ParserBase::ShortOptions() const
{
  std::string short_options;
  for (const auto& group : option_groups_) {
    for (const auto& o : group.second) {
      if (o.short_flag_ != 0) {
        short_options += o.short_flag_;
        if (!o.arg_desc_.empty()) {
          short_options += ':';
        }
      }
    }
  }
  return short_options;
}

std::string
ParserBase::FormatUsageMessage(std::string str, int offset)
{
  int width = 60;
  int current_pos = offset;
  while (current_pos + width < int(str.length())) {
    int n = str.rfind(' ', current_pos + width);
    if (n != int(std::string::npos)) {
      str.replace(n, 1, "\n\t");
      current_pos += (width + 9);
    } else {
      break;
    }
  }

  return str;
}

std::string
ParserBase::Usage()
{
  std::stringstream ss;
  for (const auto& group : option_groups_) {
    if (!group.first.empty() && !group.second.empty()) {
      ss << std::endl << group.first << ":" << std::endl;
    }

    for (const auto& o : group.second) {
      ss << "  ";
      if (o.short_flag_ != 0) {
        ss << "-" << o.short_flag_ << ", ";
      }
      if (!o.arg_desc_.empty()) {
        ss << "--" << o.flag_ << " <" << o.arg_desc_ << ">" << std::endl
           << "\t" << FormatUsageMessage(o.desc_, 0) << std::endl;
      } else {
        ss << "--" << o.flag_ << std::endl
           << "\t" << FormatUsageMessage(o.desc_, 0) << std::endl;
      }
    }
  }
  return ss.str();
}

//
// HealthCheckParser
//
HealthCheckParser::HealthCheckParser()
{
  SetupOptionGroups();
}

void
HealthCheckParser::SetupOptions()
{
  global_options_.push_back(
      {OPTION_HELP, "help", Option::ArgNone, "Print usage"});
  global_options_.push_back(
      {OPTION_VERBOSE, "verbose", Option::ArgNone,
       "Print the settings of the check and the gRPC status details.", 'v'});

  connection_options_.push_back(
      {OPTION_TARGET, "target", Option::ArgStr,
       "gRPC server target address, e.g. 'localhost:50051'. Cannot be "
       "combined with --host or --port."});
  connection_options_.push_back(
      {OPTION_HOST, "host", Option::ArgStr,
       "gRPC server host. Requires --port."});
  connection_options_.push_back(
      {OPTION_PORT, "port", Option::ArgInt,
       "gRPC server port. Requires --host."});

  check_options_.push_back(
      {OPTION_SERVICE, "service", Option::ArgStr,
       "Service name to check. The default is an empty name which checks "
       "the overall server health."});
  check_options_.push_back(
      {OPTION_TIMEOUT, "timeout", Option::ArgFloat,
       "Timeout in seconds for the health check, at most 31536000 (365 "
       "days). The default is 5.0."});
  check_options_.push_back(
      {OPTION_HEADER, "header", Option::ArgStr,
       "Metadata to send with the request in 'Name:Value' format. May be "
       "given multiple times. A repeated name keeps the last value.",
       'H'});

  tls_options_.push_back(
      {OPTION_TLS, "tls", Option::ArgNone,
       "Use TLS/SSL for the connection."});
  tls_options_.push_back(
      {OPTION_TLS_CA_CERT, "tls-ca-cert", Option::ArgStr,
       "File holding PEM-encoded root certificates. If not given the "
       "default roots are used. Requires --tls."});
  tls_options_.push_back(
      {OPTION_TLS_CLIENT_CERT, "tls-client-cert", Option::ArgStr,
       "File holding PEM-encoded client certificate chain. Requires --tls."});
  tls_options_.push_back(
      {OPTION_TLS_CLIENT_KEY, "tls-client-key", Option::ArgStr,
       "File holding PEM-encoded client private key. Requires --tls."});
  tls_options_.push_back(
      {OPTION_TLS_SERVER_NAME, "tls-server-name", Option::ArgStr,
       "Override the server name checked against the server certificate. "
       "Requires --tls."});
}

void
HealthCheckParser::SetupOptionGroups()
{
  SetupOptions();
  option_groups_.emplace_back(GLOBAL_OPTION_GROUP, global_options_);
  option_groups_.emplace_back("Connection", connection_options_);
  option_groups_.emplace_back("Health Check", check_options_);
  option_groups_.emplace_back("TLS", tls_options_);
}

HealthCheckParameters
HealthCheckParser::Parse(int argc, char** argv)
{
  //
  // Step 1. Before parsing setup
  //
  HealthCheckParameters lparams;
  bool port_present{false};
  bool tls_files_present{false};
  int option_index = 0;

  //
  // Step 2. parse options
  //
  std::vector<struct option> long_options = LongOptions();
  const std::string short_options = ShortOptions();

  // Allow Parse() to be called more than once in the same process.
  optind = 1;

  int flag;
  while ((flag = getopt_long(
              argc, argv, short_options.c_str(), &long_options[0],
              &option_index)) != -1) {
    try {
      switch (flag) {
        case OPTION_HELP:
          lparams.help_ = true;
          return lparams;
        case '?':
          // getopt_long has already reported the offending option.
          throw ParseException();
        case 'v':
        case OPTION_VERBOSE:
          lparams.verbose_ = true;
          break;
        case OPTION_TARGET:
          lparams.target_ = optarg;
          break;
        case OPTION_HOST:
          lparams.host_ = optarg;
          break;
        case OPTION_PORT:
          lparams.port_ = ParseOption<int>(optarg);
          port_present = true;
          break;
        case OPTION_SERVICE:
          lparams.service_ = optarg;
          break;
        case OPTION_TIMEOUT:
          lparams.timeout_secs_ = ParseOption<double>(optarg);
          break;
        case 'H':
        case OPTION_HEADER: {
          // A repeated name keeps the last value given.
          const auto header = ParseHeaderOption(optarg);
          lparams.headers_[header.first] = header.second;
          break;
        }
        case OPTION_TLS:
          lparams.use_tls_ = true;
          break;
        case OPTION_TLS_CA_CERT:
          lparams.ssl_options_.root_certificates = optarg;
          tls_files_present = true;
          break;
        case OPTION_TLS_CLIENT_CERT:
          lparams.ssl_options_.certificate_chain = optarg;
          tls_files_present = true;
          break;
        case OPTION_TLS_CLIENT_KEY:
          lparams.ssl_options_.private_key = optarg;
          tls_files_present = true;
          break;
        case OPTION_TLS_SERVER_NAME:
          lparams.ssl_options_.target_name_override = optarg;
          tls_files_present = true;
          break;
      }
    }
    catch (const ParseException& pe) {
      if ((pe.what() != NULL) && (strlen(pe.what()) != 0)) {
        std::stringstream ss;
        if ((flag == 'v') || (flag == 'H')) {
          ss << "Bad option: \"-" << static_cast<char>(flag) << "\".\n";
        } else {
          ss << "Bad option: \"--" << long_options[option_index].name
             << "\".\n";
        }
        ss << pe.what() << std::endl;
        throw ParseException(ss.str());
      } else {
        // In case of `Unrecognized option` just throw a ParseException
        throw ParseException();
      }
    }
  }

  if (optind < argc) {
    throw ParseException(std::string("Unexpected argument: ") + argv[optind]);
  }

  //
  // Step 3. Post parsing validation, usually for options that depend on the
  // others which are not determined until after parsing.
  //
  if (!lparams.target_.empty()) {
    if (!lparams.host_.empty() || port_present) {
      throw ParseException(
          "Error: Incompatible flags --target and --host/--port both "
          "provided. Please provide one or the other.");
    }
  } else if (!lparams.host_.empty()) {
    if (!port_present) {
      throw ParseException("Error: --port is required when using --host.");
    }
    if ((lparams.port_ <= 0) || (lparams.port_ > 65535)) {
      throw ParseException(
          "Error: --port must be in the range [1, 65535]. Got " +
          std::to_string(lparams.port_));
    }
    lparams.target_ = JoinHostPort(lparams.host_, lparams.port_);
  } else if (port_present) {
    throw ParseException("Error: --host is required when using --port.");
  } else {
    throw ParseException(
        "Error: one of the arguments --target or --host is required.");
  }

  if (!(lparams.timeout_secs_ > 0)) {
    throw ParseException(
        "Error: --timeout must be greater than 0. Got " +
        FormatSeconds(lparams.timeout_secs_));
  }
  if (!std::isfinite(lparams.timeout_secs_) ||
      (lparams.timeout_secs_ > kMaxTimeoutSecs)) {
    throw ParseException(
        "Error: --timeout must be at most 31536000 seconds (365 days). "
        "Got " +
        FormatSeconds(lparams.timeout_secs_));
  }

  if (tls_files_present && !lparams.use_tls_) {
    throw ParseException(
        "Error: Use of '--tls-ca-cert', '--tls-client-cert', "
        "'--tls-client-key' or '--tls-server-name' requires '--tls' as "
        "well.");
  }

  return lparams;
}

std::pair<std::string, std::string>
HealthCheckParser::ParseHeaderOption(const std::string& arg)
{
  int delim = arg.find(":");
  if (delim < 0) {
    std::stringstream ss;
    ss << "--header option format is 'Name:Value'. Got " << arg << std::endl;
    throw ParseException(ss.str());
  }

  // GRPC uses HTTP2 which requires header names to be in lowercase.
  std::string name = arg.substr(0, delim);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  static const RE2 kMetadataKey("[0-9a-z_.\\-]+");
  if (!RE2::FullMatch(name, kMetadataKey) || (name.rfind("grpc-", 0) == 0)) {
    std::stringstream ss;
    ss << "Invalid header name '" << name
       << "'. Names may only contain [0-9a-z_.-] and must not start with "
          "'grpc-'."
       << std::endl;
    throw ParseException(ss.str());
  }

  return {name, arg.substr(delim + 1)};
}

}  // namespace healthcheck
