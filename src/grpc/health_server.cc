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
#include "health_server.h"

#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "grpc++/support/status.h"

namespace healthcheck { namespace grpc {

namespace {

//=========================================================================
//  A single thread is created to handle all health check requests as they
//  are deemed to be not performance critical.
//=========================================================================

template <typename ResponderType, typename RequestType, typename ResponseType>
class CommonCallData : public ICallData {
 public:
  using StandardRegisterFunc = std::function<void(
      ::grpc::ServerContext*, RequestType*, ResponderType*, void*)>;
  using StandardCallbackFunc =
      std::function<void(RequestType&, ResponseType*, ::grpc::Status*)>;

  CommonCallData(
      const std::string& name, const uint64_t id,
      const StandardRegisterFunc OnRegister,
      const StandardCallbackFunc OnExecute, ::grpc::ServerCompletionQueue* cq,
      const bool verbose, const uint64_t response_delay_ms = 0)
      : name_(name), id_(id), OnRegister_(OnRegister), OnExecute_(OnExecute),
        cq_(cq), verbose_(verbose), responder_(&ctx_), step_(Steps::START),
        response_delay_ms_(response_delay_ms)
  {
    OnRegister_(&ctx_, &request_, &responder_, this);
  }

  bool Process(bool ok) override;

  std::string Name() override { return name_; }

  uint64_t Id() override { return id_; }

 private:
  void WriteResponse();

  const std::string name_;
  const uint64_t id_;
  const StandardRegisterFunc OnRegister_;
  const StandardCallbackFunc OnExecute_;
  ::grpc::ServerCompletionQueue* cq_;
  const bool verbose_;

  ::grpc::ServerContext ctx_;

  ResponderType responder_;
  RequestType request_;
  ResponseType response_;
  ::grpc::Status status_;

  Steps step_;

  const uint64_t response_delay_ms_;
};

template <typename ResponderType, typename RequestType, typename ResponseType>
bool
CommonCallData<ResponderType, RequestType, ResponseType>::Process(bool rpc_ok)
{
  // If RPC failed on a new request then the server is shutting down
  // and so we should do nothing (including not registering for a new
  // request). If RPC failed on a non-START step then there is nothing
  // we can do since we one execute one step.
  const bool shutdown = (!rpc_ok && (step_ == Steps::START));
  if (shutdown) {
    step_ = Steps::FINISH;
  }

  if (step_ == Steps::START) {
    // Start a new request to replace this one...
    new CommonCallData<ResponderType, RequestType, ResponseType>(
        name_, id_ + 1, OnRegister_, OnExecute_, cq_, verbose_,
        response_delay_ms_);

    OnExecute_(request_, &response_, &status_);
    WriteResponse();
  } else if (step_ == Steps::COMPLETE) {
    step_ = Steps::FINISH;
  }

  return step_ != Steps::FINISH;
}

template <typename ResponderType, typename RequestType, typename ResponseType>
void
CommonCallData<ResponderType, RequestType, ResponseType>::WriteResponse()
{
  if (response_delay_ms_ != 0) {
    // Delay the write of the response by the specified time so that a
    // client deadline can expire first.
    std::this_thread::sleep_for(std::chrono::milliseconds(response_delay_ms_));
  }
  step_ = Steps::COMPLETE;
  responder_.Finish(response_, status_, this);
}

//
// CommonHandler
//
// Serves grpc.health.v1.Health/Check from the status table.
//
class CommonHandler : public HandlerBase {
 public:
  CommonHandler(
      const std::string& name, HealthAsyncService* health_service,
      ::grpc::ServerCompletionQueue* cq,
      const std::shared_ptr<StatusTable>& statuses, const bool verbose,
      const uint64_t response_delay_ms);

  // Descriptive name of of the handler.
  const std::string& Name() const { return name_; }

  // Start handling requests.
  void Start() override;

  // Stop handling requests.
  void Stop() override;

 private:
  void SetUpAllRequests();
  void RegisterHealthCheck();

  const std::string name_;
  HealthAsyncService* health_service_;
  ::grpc::ServerCompletionQueue* cq_;
  std::shared_ptr<StatusTable> statuses_;
  std::unique_ptr<std::thread> thread_;
  const bool verbose_;
  const uint64_t response_delay_ms_;
};

CommonHandler::CommonHandler(
    const std::string& name, HealthAsyncService* health_service,
    ::grpc::ServerCompletionQueue* cq,
    const std::shared_ptr<StatusTable>& statuses, const bool verbose,
    const uint64_t response_delay_ms)
    : name_(name), health_service_(health_service), cq_(cq),
      statuses_(statuses), verbose_(verbose),
      response_delay_ms_(response_delay_ms)
{
}

void
CommonHandler::Start()
{
  // Use a barrier to make sure we don't return until thread has
  // started.
  auto barrier = std::make_shared<Barrier>(2);

  thread_.reset(new std::thread([this, barrier] {
    SetUpAllRequests();
    barrier->Wait();

    void* tag;
    bool ok;

    while (cq_->Next(&tag, &ok)) {
      ICallData* call_data = static_cast<ICallData*>(tag);
      if (!call_data->Process(ok)) {
        delete call_data;
      }
    }
  }));

  barrier->Wait();
}

void
CommonHandler::Stop()
{
  if (thread_ && thread_->joinable()) {
    thread_->join();
  }
}

void
CommonHandler::SetUpAllRequests()
{
  // health (GRPC standard)
  RegisterHealthCheck();
}

void
CommonHandler::RegisterHealthCheck()
{
  auto OnRegisterHealthCheck =
      [this](
          ::grpc::ServerContext* ctx,
          ::grpc::health::v1::HealthCheckRequest* request,
          ::grpc::ServerAsyncResponseWriter<
              ::grpc::health::v1::HealthCheckResponse>* responder,
          void* tag) {
        this->health_service_->RequestCheck(
            ctx, request, responder, this->cq_, this->cq_, tag);
      };

  auto OnExecuteHealthCheck = [this](
                                  ::grpc::health::v1::HealthCheckRequest&
                                      request,
                                  ::grpc::health::v1::HealthCheckResponse*
                                      response,
                                  ::grpc::Status* status) {
    ServingStatus serving_status =
        ::grpc::health::v1::HealthCheckResponse::UNKNOWN;
    Error err;
    if (statuses_->Get(request.service(), &serving_status)) {
      response->set_status(serving_status);
    } else {
      err = Error(Error::Code::SERVICE_NOT_FOUND, "service name unknown");
    }

    if (verbose_) {
      std::cout << "Health check for '" << request.service() << "': "
                << (err.IsOk() ? ServingStatusName(serving_status)
                               : err.Message())
                << std::endl;
    }

    GrpcStatusUtil::Create(status, err);
  };

  new CommonCallData<
      ::grpc::ServerAsyncResponseWriter<
          ::grpc::health::v1::HealthCheckResponse>,
      ::grpc::health::v1::HealthCheckRequest,
      ::grpc::health::v1::HealthCheckResponse>(
      "Check", 0, OnRegisterHealthCheck, OnExecuteHealthCheck, cq_, verbose_,
      response_delay_ms_);
}

}  // namespace

//
// StatusTable
//
void
StatusTable::Set(const std::string& service, ServingStatus status)
{
  std::lock_guard<std::mutex> lock(mu_);
  statuses_[service] = status;
}

bool
StatusTable::Clear(const std::string& service)
{
  std::lock_guard<std::mutex> lock(mu_);
  return statuses_.erase(service) != 0;
}

bool
StatusTable::Get(const std::string& service, ServingStatus* status) const
{
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = statuses_.find(service);
  if (it == statuses_.end()) {
    return false;
  }
  *status = it->second;
  return true;
}

std::map<std::string, ServingStatus>
StatusTable::Snapshot() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return statuses_;
}

//
// Server
//
Server::Server(const Options& options)
    : options_(options),
      server_addr_(
          JoinHostPort(options.socket_.address_, options.socket_.port_)),
      statuses_(std::make_shared<StatusTable>())
{
  std::shared_ptr<::grpc::ServerCredentials> credentials;
  const auto& ssl_options = options.ssl_;
  if (ssl_options.use_ssl_) {
    std::string key;
    std::string cert;
    std::string root;
    Error err = ReadFile(ssl_options.server_cert_, &cert);
    if (err.IsOk()) {
      err = ReadFile(ssl_options.server_key_, &key);
    }
    if (err.IsOk()) {
      err = ReadFile(ssl_options.root_cert_, &root);
    }
    if (!err.IsOk()) {
      throw std::invalid_argument(err.Message());
    }
    ::grpc::SslServerCredentialsOptions::PemKeyCertPair keycert = {key, cert};
    ::grpc::SslServerCredentialsOptions sslOpts;
    sslOpts.pem_root_certs = root;
    sslOpts.pem_key_cert_pairs.push_back(keycert);
    if (ssl_options.use_mutual_auth_) {
      sslOpts.client_certificate_request =
          GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;
    }
    credentials = ::grpc::SslServerCredentials(sslOpts);
  } else {
    credentials = ::grpc::InsecureServerCredentials();
  }

  builder_.AddListeningPort(server_addr_, credentials, &bound_port_);
  builder_.RegisterService(&health_service_);
  // A second server on the same port must fail to start.
  builder_.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);

  common_cq_ = builder_.AddCompletionQueue();
  common_handler_.reset(new CommonHandler(
      "CommonHandler", &health_service_, common_cq_.get(), statuses_,
      options.verbose_, options.response_delay_ms_));
}

Server::~Server()
{
  IGNORE_ERR(Stop());
}

Error
Server::Create(const Options& options, std::unique_ptr<Server>* server)
{
  try {
    server->reset(new Server(options));
  }
  catch (const std::invalid_argument& pe) {
    return Error(Error::Code::INVALID_ARG, pe.what());
  }

  return Error::Success;
}

Error
Server::Start()
{
  if (running_) {
    return Error(
        Error::Code::ALREADY_EXISTS, "gRPC health server is already running.");
  }
  if (server_ != nullptr) {
    return Error(
        Error::Code::UNAVAILABLE, "gRPC health server cannot be restarted.");
  }

  server_ = builder_.BuildAndStart();
  // Check if binding port failed
  if ((server_ == nullptr) || (bound_port_ == 0)) {
    return Error(
        Error::Code::UNAVAILABLE,
        std::string("Socket '") + server_addr_ + "' already in use");
  }

  common_handler_->Start();

  running_ = true;
  if (options_.verbose_) {
    std::cout << "Started " << kHealthServiceName << " at "
              << JoinHostPort(options_.socket_.address_, bound_port_)
              << std::endl;
  }
  return Error::Success;
}

Error
Server::Stop()
{
  if (!running_) {
    return Error(
        Error::Code::UNAVAILABLE, "gRPC health server is not running.");
  }

  // Always shutdown the completion queue after the server.
  server_->Shutdown();
  common_cq_->Shutdown();

  // Must stop the handler explicitly to wait for the handler thread to
  // join since it is referencing the completion queue.
  common_handler_->Stop();

  running_ = false;
  return Error::Success;
}

void
Server::SetServingStatus(const std::string& service, ServingStatus status)
{
  statuses_->Set(service, status);
}

Error
Server::ClearServingStatus(const std::string& service)
{
  if (!statuses_->Clear(service)) {
    return Error(
        Error::Code::SERVICE_NOT_FOUND,
        "service '" + service + "' is not registered");
  }
  return Error::Success;
}

}}  // namespace healthcheck::grpc
