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
#include "example_server_parser.h"

#include <cstring>
#include <sstream>

constexpr const char* GLOBAL_OPTION_GROUP = "";

namespace healthcheck {

enum ExampleServerOptionId {
  OPTION_SERVER_HELP = 2000,
  OPTION_SERVER_VERBOSE,
  OPTION_SERVER_ADDRESS,
  OPTION_SERVER_PORT,
  OPTION_SERVER_STATUS,
  OPTION_SERVER_RESPONSE_DELAY_MS,
  OPTION_SERVER_TLS_CERT,
  OPTION_SERVER_TLS_KEY,
  OPTION_SERVER_TLS_ROOT_CERT,
  OPTION_SERVER_TLS_MUTUAL_AUTH,
};

//
// ExampleServerParser
//
ExampleServerParser::ExampleServerParser()
{
  SetupOptionGroups();
}

void
ExampleServerParser::SetupOptions()
{
  global_options_.push_back(
      {OPTION_SERVER_HELP, "help", Option::ArgNone, "Print usage"});
  global_options_.push_back(
      {OPTION_SERVER_VERBOSE, "verbose", Option::ArgNone,
       "Print a line for every health check served.", 'v'});

  server_options_.push_back(
      {OPTION_SERVER_ADDRESS, "address", Option::ArgStr,
       "The address for the server to bind to. The default is 0.0.0.0."});
  server_options_.push_back(
      {OPTION_SERVER_PORT, "port", Option::ArgInt,
       "The port for the server to listen on. The default is 50051. Use 0 "
       "to pick a free port."});

  health_options_.push_back(
      {OPTION_SERVER_STATUS, "status", Option::ArgStr,
       "Serving status of a service in '<service>=<status>' format, where "
       "<status> is one of UNKNOWN, SERVING, NOT_SERVING or SERVICE_UNKNOWN. "
       "An empty <service> sets the overall server health. May be given "
       "multiple times; overrides the built-in example statuses."});
  health_options_.push_back(
      {OPTION_SERVER_RESPONSE_DELAY_MS, "response-delay-ms", Option::ArgInt,
       "Delay every health check response by the given number of "
       "milliseconds. Useful to exercise client timeouts."});

  tls_options_.push_back(
      {OPTION_SERVER_TLS_CERT, "tls-cert", Option::ArgStr,
       "File holding PEM-encoded server certificate. Enables TLS, requires "
       "--tls-key."});
  tls_options_.push_back(
      {OPTION_SERVER_TLS_KEY, "tls-key", Option::ArgStr,
       "File holding PEM-encoded server key. Requires --tls-cert."});
  tls_options_.push_back(
      {OPTION_SERVER_TLS_ROOT_CERT, "tls-root-cert", Option::ArgStr,
       "File holding PEM-encoded root certificate used to verify clients."});
  tls_options_.push_back(
      {OPTION_SERVER_TLS_MUTUAL_AUTH, "tls-mutual-auth", Option::ArgBool,
       "Require and verify client certificates. Requires --tls-root-cert."});
}

void
ExampleServerParser::SetupOptionGroups()
{
  SetupOptions();
  option_groups_.emplace_back(GLOBAL_OPTION_GROUP, global_options_);
  option_groups_.emplace_back("Server", server_options_);
  option_groups_.emplace_back("Health", health_options_);
  option_groups_.emplace_back("TLS", tls_options_);
}

ExampleServerParameters
ExampleServerParser::Parse(int argc, char** argv)
{
  ExampleServerParameters lparams;
  grpc::Options& lgrpc_options = lparams.grpc_options_;
  int option_index = 0;

  std::vector<struct option> long_options = LongOptions();
  const std::string short_options = ShortOptions();

  optind = 1;

  int flag;
  while ((flag = getopt_long(
              argc, argv, short_options.c_str(), &long_options[0],
              &option_index)) != -1) {
    try {
      switch (flag) {
        case OPTION_SERVER_HELP:
          lparams.help_ = true;
          return lparams;
        case '?':
          throw ParseException();
        case 'v':
        case OPTION_SERVER_VERBOSE:
          lgrpc_options.verbose_ = true;
          break;
        case OPTION_SERVER_ADDRESS:
          lgrpc_options.socket_.address_ = optarg;
          break;
        case OPTION_SERVER_PORT:
          lgrpc_options.socket_.port_ = ParseOption<int>(optarg);
          break;
        case OPTION_SERVER_STATUS:
          lparams.statuses_.push_back(ParseStatusOption(optarg));
          break;
        case OPTION_SERVER_RESPONSE_DELAY_MS:
          lgrpc_options.response_delay_ms_ = ParseOption<uint64_t>(optarg);
          break;
        case OPTION_SERVER_TLS_CERT:
          lgrpc_options.ssl_.server_cert_ = optarg;
          lgrpc_options.ssl_.use_ssl_ = true;
          break;
        case OPTION_SERVER_TLS_KEY:
          lgrpc_options.ssl_.server_key_ = optarg;
          break;
        case OPTION_SERVER_TLS_ROOT_CERT:
          lgrpc_options.ssl_.root_cert_ = optarg;
          break;
        case OPTION_SERVER_TLS_MUTUAL_AUTH:
          lgrpc_options.ssl_.use_mutual_auth_ = ParseOption<bool>(optarg);
          break;
      }
    }
    catch (const ParseException& pe) {
      if ((pe.what() != NULL) && (strlen(pe.what()) != 0)) {
        std::stringstream ss;
        ss << "Bad option: \"--" << long_options[option_index].name << "\".\n"
           << pe.what() << std::endl;
        throw ParseException(ss.str());
      } else {
        throw ParseException();
      }
    }
  }

  if (optind < argc) {
    throw ParseException(std::string("Unexpected argument: ") + argv[optind]);
  }

  if ((lgrpc_options.socket_.port_ < 0) ||
      (lgrpc_options.socket_.port_ > 65535)) {
    throw ParseException(
        "Error: --port must be in the range [0, 65535]. Got " +
        std::to_string(lgrpc_options.socket_.port_));
  }

  const auto& ssl = lgrpc_options.ssl_;
  if (ssl.server_cert_.empty() != ssl.server_key_.empty()) {
    throw ParseException(
        "Error: '--tls-cert' and '--tls-key' must be provided together.");
  }
  if (!ssl.use_ssl_ && (!ssl.root_cert_.empty() || ssl.use_mutual_auth_)) {
    throw ParseException(
        "Error: Use of '--tls-root-cert' or '--tls-mutual-auth' requires "
        "'--tls-cert' and '--tls-key' as well.");
  }
  if (ssl.use_mutual_auth_ && ssl.root_cert_.empty()) {
    throw ParseException(
        "Error: '--tls-mutual-auth' requires '--tls-root-cert'.");
  }

  return lparams;
}

std::pair<std::string, grpc::ServingStatus>
ExampleServerParser::ParseStatusOption(const std::string& arg)
{
  // Format is "<service>=<status>". Service names may not contain '=' so
  // the last one separates the status.
  int delim = arg.rfind("=");
  if (delim < 0) {
    std::stringstream ss;
    ss << "--status option format is '<service>=<status>'. Got " << arg
       << std::endl;
    throw ParseException(ss.str());
  }

  grpc::ServingStatus status;
  const std::string status_str = arg.substr(delim + 1);
  if (!grpc::ParseServingStatus(status_str, &status)) {
    std::stringstream ss;
    ss << "invalid serving status '" << status_str
       << "', expecting one of UNKNOWN, SERVING, NOT_SERVING or "
          "SERVICE_UNKNOWN"
       << std::endl;
    throw ParseException(ss.str());
  }

  return {arg.substr(0, delim), status};
}

}  // namespace healthcheck
