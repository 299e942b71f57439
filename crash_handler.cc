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

// WARNING: the handlers below run in signal context. Only async-signal-safe
// code is allowed in them: no malloc, no stdio, no LOG(). The only exception
// is the final fflush() before the process dies.

#include "./crash_handler.h"

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <cstddef>
#include <cstdint>

#include "absl/base/const_init.h"
#include "absl/base/internal/raw_logging.h"
#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "./crash_context.h"
#include "./defs.h"
#include "./logging.h"
#include "./signal_action.h"

namespace ferret {

namespace {

// Formats at most kMaxReportedInputBytes of [data, data + size) as hex into
// `out`, followed by "..." if truncated. `out` is always NUL-terminated.
template <size_t kOutSize>
void FormatInputPrefix(const uint8_t *data, size_t size,
                       char (&out)[kOutSize]) {
  static_assert(kOutSize >= kMaxReportedInputBytes * 2 + 4);
  static constexpr char kHexDigits[] = "0123456789abcdef";
  const size_t num_bytes =
      size < kMaxReportedInputBytes ? size : kMaxReportedInputBytes;
  size_t pos = 0;
  for (size_t i = 0; i < num_bytes; ++i) {
    out[pos++] = kHexDigits[data[i] >> 4];
    out[pos++] = kHexDigits[data[i] & 0xF];
  }
  if (num_bytes < size) {
    out[pos++] = '.';
    out[pos++] = '.';
    out[pos++] = '.';
  }
  out[pos] = '\0';
}

// Reports `what` happened to the run described by `context`.
void ReportRun(const char *what, int signum, const CrashContext &context) {
  const char *executor_name = ExecutorNameForToken(context.token);
  char input_prefix[kMaxReportedInputBytes * 2 + 4];
  FormatInputPrefix(context.data, context.size, input_prefix);
  ABSL_RAW_LOG(ERROR,
               "========= %s: %s in executor '%s' (token %llu) while running "
               "an input of %zu bytes: {%s}",
               what, SignalName(signum),
               executor_name ? executor_name : "<unregistered>",
               static_cast<unsigned long long>(context.token), context.size,
               input_prefix);
}

void HandleCrash(int signum, siginfo_t *info, void *) {
  const CrashContext context = CurrentCrashContext();
  if (context.token == kNoExecutor) {
    ABSL_RAW_LOG(ERROR,
                 "========= %s at address %p outside of any target run; "
                 "crash not attributed",
                 SignalName(signum), info ? info->si_addr : nullptr);
  } else {
    ReportRun("Target crashed", signum, context);
    fflush(nullptr);
  }
  // Die by the same signal. SA_NODEFER makes it deliverable right away.
  RestoreDefaultSignalHandler(signum);
  raise(signum);
}

void HandleTimeout(int signum, siginfo_t *, void *) {
  const CrashContext context = CurrentCrashContext();
  if (context.token == kNoExecutor) {
    ABSL_RAW_LOG(INFO, "%s received, but no target run is in flight; ignoring",
                 SignalName(signum));
    return;
  }
  ReportRun("Target timed out", signum, context);
  fflush(nullptr);
  // abort() must not be reported as a second, crash-type failure.
  RestoreDefaultSignalHandler(SIGABRT);
  abort();
}

// Serializes InstallCrashHandlers(). The handlers themselves never take it.
ABSL_CONST_INIT absl::Mutex install_mu(absl::kConstInit);
// 0 until the first successful InstallCrashHandlers().
int installed_timeout_signal ABSL_GUARDED_BY(install_mu) = 0;

}  // namespace

absl::Status InstallCrashHandlers(int timeout_signal) {
  for (int signum : kCrashSignals) {
    if (signum == timeout_signal) {
      return absl::InvalidArgumentError(absl::StrCat(
          "timeout signal ", SignalName(timeout_signal),
          " is already handled as a crash signal"));
    }
  }
  absl::MutexLock lock(&install_mu);
  for (int signum : kCrashSignals) {
    absl::Status status = SetSignalHandler(signum, HandleCrash);
    if (!status.ok()) return status;
  }
  absl::Status status = SetSignalHandler(timeout_signal, HandleTimeout);
  if (!status.ok()) return status;
  if (installed_timeout_signal != 0 &&
      installed_timeout_signal != timeout_signal) {
    RestoreDefaultSignalHandler(installed_timeout_signal);
  }
  installed_timeout_signal = timeout_signal;
  return absl::OkStatus();
}

int InstalledTimeoutSignal() {
  absl::MutexLock lock(&install_mu);
  return installed_timeout_signal;
}

void InstallCrashHandlersOrDie(int timeout_signal) {
  absl::Status status = InstallCrashHandlers(timeout_signal);
  if (!status.ok()) {
    LOG(FATAL) << "Failed to install crash handlers, refusing to run targets "
                  "without crash detection: "
               << status;
  }
}

}  // namespace ferret
