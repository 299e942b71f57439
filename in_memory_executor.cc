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

#include "./in_memory_executor.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./crash_context.h"
#include "./crash_handler.h"
#include "./defs.h"
#include "./environment.h"
#include "./logging.h"

namespace ferret {

InMemoryExecutor::InMemoryExecutor(Harness harness, const Environment &env)
    : harness_(std::move(harness)),
      token_(RegisterExecutor(env.executor_name)) {
  CHECK(harness_ != nullptr);
  InstallCrashHandlersOrDie(env.timeout_signal);
  if (env.log_level > 1) {
    LOG(INFO) << "Created in-memory executor " << VV(env.executor_name)
              << VV(token_) << VV(env.timeout_signal);
  }
}

InMemoryExecutor::~InMemoryExecutor() { UnregisterExecutor(token_); }

absl::StatusOr<ExitKind> InMemoryExecutor::RunTarget() {
  if (cur_input() == nullptr) {
    return absl::FailedPreconditionError("no current input to run");
  }
  const absl::StatusOr<ByteArray> bytes = cur_input()->Serialize();
  if (!bytes.ok()) return bytes.status();

  ExitKind exit_kind = ExitKind::kOk;
  const absl::Time start_time = absl::Now();
  {
    ScopedCrashContext crash_context(token_, *bytes);
    exit_kind = harness_(*this, *bytes);
  }
  last_exec_time_ = absl::Now() - start_time;
  ++num_runs_;
  return exit_kind;
}

}  // namespace ferret
