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

// Thin layer over the platform's signal API.
// Everything platform-specific about installing crash handlers lives here,
// so that the executor and the handlers themselves stay portable.

#ifndef THIRD_PARTY_FERRET_SIGNAL_ACTION_H_
#define THIRD_PARTY_FERRET_SIGNAL_ACTION_H_

#include <signal.h>

#include "absl/status/status.h"

namespace ferret {

using SignalHandler = void (*)(int signum, siginfo_t *info, void *ucontext);

// Installs `handler` for `signum` with SA_SIGINFO | SA_NODEFER.
// Returns an error status if the platform refuses, e.g. for SIGKILL.
absl::Status SetSignalHandler(int signum, SignalHandler handler);

// Restores the default disposition of `signum`.
// Async-signal-safe.
void RestoreDefaultSignalHandler(int signum);

// Returns "SIGSEGV", "SIGUSR2", etc, or "signal" for unknown numbers.
// Async-signal-safe.
const char *SignalName(int signum);

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_SIGNAL_ACTION_H_
