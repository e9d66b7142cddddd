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
#include "healthcheck_signal.h"

#include <pthread.h>
#include <signal.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#define BOOST_STACKTRACE_USE_ADDR2LINE
#include <boost/stacktrace.hpp>

namespace healthcheck {

bool signal_exiting_ = false;
std::mutex signal_exit_mu_;
std::condition_variable signal_exit_cv_;

namespace {

// Both guarded by 'signal_exit_mu_'.
int exit_signal_ = 0;
bool registered_ = false;

void
ExitSignalThread(sigset_t exit_signals)
{
  int signum = 0;
  const int err = sigwait(&exit_signals, &signum);
  if (err != 0) {
    std::cerr << "error: failed to wait for exit signals: " << strerror(err)
              << std::endl;
    return;
  }

  std::cout << "Signal (" << signum << ") received." << std::endl;
  {
    std::lock_guard<std::mutex> lock(signal_exit_mu_);
    signal_exiting_ = true;
    exit_signal_ = signum;
  }
  signal_exit_cv_.notify_all();
}

void
CrashSignalHandler(int signum)
{
  std::cerr << "Signal (" << signum << ") received." << std::endl;
  std::cerr << boost::stacktrace::stacktrace() << std::endl;

  // SA_RESETHAND already restored the default action.
  raise(signum);
}

}  // namespace

Error
RegisterSignalHandler()
{
  std::lock_guard<std::mutex> lock(signal_exit_mu_);
  if (registered_) {
    return Error::Success;
  }

  struct sigaction crash;
  memset(&crash, 0, sizeof(crash));
  crash.sa_handler = CrashSignalHandler;
  sigemptyset(&crash.sa_mask);
  crash.sa_flags = SA_RESETHAND;
  for (const int signum : {SIGSEGV, SIGABRT}) {
    if (sigaction(signum, &crash, nullptr) != 0) {
      return Error(
          Error::Code::OTHER, std::string("failed to register handler for ") +
                                  strsignal(signum) + ": " + strerror(errno));
    }
  }

  // Writes to a connection the client already closed must not kill the
  // process.
  signal(SIGPIPE, SIG_IGN);

  sigset_t exit_signals;
  sigemptyset(&exit_signals);
  sigaddset(&exit_signals, SIGINT);
  sigaddset(&exit_signals, SIGTERM);
  const int err = pthread_sigmask(SIG_BLOCK, &exit_signals, nullptr);
  if (err != 0) {
    return Error(
        Error::Code::OTHER,
        std::string("failed to block exit signals: ") + strerror(err));
  }

  try {
    std::thread(ExitSignalThread, exit_signals).detach();
  }
  catch (const std::system_error& se) {
    return Error(
        Error::Code::OTHER,
        std::string("failed to start signal thread: ") + se.what());
  }

  registered_ = true;
  return Error::Success;
}

int
WaitForExitSignal()
{
  std::unique_lock<std::mutex> lock(signal_exit_mu_);
  signal_exit_cv_.wait(lock, [] { return signal_exiting_; });
  return exit_signal_;
}

int
WaitForExitSignal(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(signal_exit_mu_);
  signal_exit_cv_.wait_for(lock, timeout, [] { return signal_exiting_; });
  return exit_signal_;
}

}  // namespace healthcheck
