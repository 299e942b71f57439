// Copyright 2022 The Ferret Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "./signal_action.h"

#include <errno.h>
#include <signal.h>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace ferret {

absl::Status SetSignalHandler(int signum, SignalHandler handler) {
  struct sigaction sigact = {};
  sigemptyset(&sigact.sa_mask);
  sigact.sa_sigaction = handler;
  // SA_NODEFER: a handler that re-raises its own signal must not have it
  // blocked.
  sigact.sa_flags = SA_SIGINFO | SA_NODEFER;
  if (sigaction(signum, &sigact, nullptr) != 0) {
    return absl::ErrnoToStatus(
        errno, absl::StrCat("sigaction(", SignalName(signum), ")"));
  }
  return absl::OkStatus();
}

void RestoreDefaultSignalHandler(int signum) {
  struct sigaction sigact = {};
  sigemptyset(&sigact.sa_mask);
  sigact.sa_handler = SIG_DFL;
  sigaction(signum, &sigact, nullptr);
}

const char *SignalName(int signum) {
  switch (signum) {
    case SIGSEGV:
      return "SIGSEGV";
    case SIGBUS:
      return "SIGBUS";
    case SIGABRT:
      return "SIGABRT";
    case SIGILL:
      return "SIGILL";
    case SIGFPE:
      return "SIGFPE";
    case SIGPIPE:
      return "SIGPIPE";
    case SIGALRM:
      return "SIGALRM";
    case SIGUSR1:
      return "SIGUSR1";
    case SIGUSR2:
      return "SIGUSR2";
    case SIGKILL:
      return "SIGKILL";
    case SIGSTOP:
      return "SIGSTOP";
    default:
      return "signal";
  }
}

}  // namespace ferret
