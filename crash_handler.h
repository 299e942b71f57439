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

// Crash and timeout detection for in-process execution.
//
// A crash handler is installed for every signal in kCrashSignals. It reports
// the crash, attributing it to the executor whose harness is running on the
// current thread (see crash_context.h), if any. Then it restores the default
// disposition of the signal and re-raises it: the process dies exactly as it
// would have without the handler, and the parent sees the original signal.
//
// A timeout handler is installed for the timeout signal, which an external
// watchdog sends when a run exceeds its deadline. If a run is in flight, the
// handler reports the timeout and aborts. Otherwise the signal is stale and is
// ignored.
//
// The handlers write their reports with ABSL_RAW_LOG, to stderr.

#ifndef THIRD_PARTY_FERRET_CRASH_HANDLER_H_
#define THIRD_PARTY_FERRET_CRASH_HANDLER_H_

#include <signal.h>

#include <cstddef>

#include "absl/status/status.h"

namespace ferret {

// Signals that mean the target has crashed.
inline constexpr int kCrashSignals[] = {SIGSEGV, SIGBUS, SIGABRT,
                                        SIGILL,  SIGFPE, SIGPIPE};

inline constexpr int kDefaultTimeoutSignal = SIGUSR2;

// At most this many input bytes are printed in a crash or timeout report.
inline constexpr size_t kMaxReportedInputBytes = 32;

// Installs the crash handler for every signal in kCrashSignals and the
// timeout handler for `timeout_signal`. Idempotent.
// There is one timeout signal per process: if a different one was installed
// before, its default disposition is restored.
// Returns the first installation error, if any; later signals are not tried.
absl::Status InstallCrashHandlers(int timeout_signal = kDefaultTimeoutSignal);

// Same as above, but LOG(FATAL)s on failure.
void InstallCrashHandlersOrDie(int timeout_signal = kDefaultTimeoutSignal);

// The timeout signal of the last successful InstallCrashHandlers(), or 0.
int InstalledTimeoutSignal();

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_CRASH_HANDLER_H_
