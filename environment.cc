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

#include "./environment.h"

#include <signal.h>

#include <cstddef>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "./crash_handler.h"
#include "./logging.h"

ABSL_FLAG(std::string, executor_name, "in_memory",
          "Name of the executor. Appears in crash and timeout reports, "
          "so that a crash can be attributed when several executors exist.");
ABSL_FLAG(int, timeout_signal, SIGUSR2,
          "The signal number an external watchdog sends when a run exceeds "
          "its deadline. If a run is in flight when it arrives, the process "
          "reports a timeout and aborts; otherwise the signal is ignored. "
          "Must not be one of the crash signals "
          "(SIGSEGV, SIGBUS, SIGABRT, SIGILL, SIGFPE, SIGPIPE).");
ABSL_FLAG(size_t, max_len, 1 << 20,
          "Max length of an input read from a file by the runner. "
          "Longer files are truncated.");
ABSL_FLAG(size_t, log_level, 1,
          "Log level. 0: errors only; 1: a line per input; "
          "2: also per-input features.");

namespace ferret {

Environment::Environment(const std::vector<std::string> &argv)
    : executor_name(absl::GetFlag(FLAGS_executor_name)),
      timeout_signal(absl::GetFlag(FLAGS_timeout_signal)),
      max_len(absl::GetFlag(FLAGS_max_len)),
      log_level(absl::GetFlag(FLAGS_log_level)) {
  for (int signum : kCrashSignals) {
    CHECK_NE(timeout_signal, signum) << "--timeout_signal is a crash signal";
  }
  CHECK_GT(max_len, 0);
  if (!argv.empty()) {
    exec_name = argv[0];
    args.assign(argv.begin() + 1, argv.end());
  }
}

}  // namespace ferret
