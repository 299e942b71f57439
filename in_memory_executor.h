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

#ifndef THIRD_PARTY_FERRET_IN_MEMORY_EXECUTOR_H_
#define THIRD_PARTY_FERRET_IN_MEMORY_EXECUTOR_H_

#include <cstddef>
#include <cstdint>
#include <functional>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./environment.h"
#include "./executor.h"

namespace ferret {

// Executes inputs by calling a harness function in the current process,
// on the caller's stack.
//
// While the harness runs, the executor's token is published in the thread's
// crash-context slot, so that the crash handlers can attribute a crash or a
// timeout to this executor. Crashes and timeouts kill the process; RunTarget()
// never returns them.
class InMemoryExecutor : public Executor {
 public:
  // The harness gets the executor (to inspect the current input or the
  // observers, if it wants to) and the serialized current input.
  using Harness = std::function<ExitKind(const Executor &executor,
                                         absl::Span<const uint8_t> data)>;

  // Registers the executor as `env.executor_name` and installs the crash
  // handlers, with `env.timeout_signal` as the timeout signal. The timeout
  // signal is per process: the last constructed executor's signal wins.
  // Dies if the handlers can't be installed, or if kMaxRegisteredExecutors
  // executors are already alive (see crash_context.h).
  explicit InMemoryExecutor(Harness harness,
                            const Environment &env = Environment());
  ~InMemoryExecutor() override;

  // Serializes the current input and calls the harness on it once.
  // Returns FailedPrecondition if there is no current input, or the input's
  // error if it fails to serialize. The harness is not called in either case.
  absl::StatusOr<ExitKind> RunTarget() override;

  // Accessors.
  ExecutorToken token() const { return token_; }
  // The number of harness invocations that returned.
  size_t num_runs() const { return num_runs_; }
  // Wall time of the last harness invocation that returned.
  absl::Duration last_exec_time() const { return last_exec_time_; }

 private:
  const Harness harness_;
  const ExecutorToken token_;
  size_t num_runs_ = 0;
  absl::Duration last_exec_time_;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_IN_MEMORY_EXECUTOR_H_
