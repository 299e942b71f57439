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

// The state shared between executors and the crash handlers.
//
// Executors are known to the crash handlers only by an opaque ExecutorToken,
// issued by RegisterExecutor(). While a harness is running, the executor
// publishes its token in the calling thread's crash-context slot, via
// ScopedCrashContext. A signal handler running on that thread calls
// CurrentCrashContext() to find out whether the signal arrived during a run,
// and ExecutorNameForToken() to describe the executor.
//
// All the functions marked async-signal-safe may be called from a signal
// handler. Nothing here allocates after RegisterExecutor() returns.

#ifndef THIRD_PARTY_FERRET_CRASH_CONTEXT_H_
#define THIRD_PARTY_FERRET_CRASH_CONTEXT_H_

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "absl/types/span.h"
#include "./defs.h"

namespace ferret {

// At most this many executors may be registered at the same time.
inline constexpr size_t kMaxRegisteredExecutors = 64;
// Longer names are truncated by RegisterExecutor().
inline constexpr size_t kMaxExecutorNameLength = 63;

// Registers an executor called `name` and returns its token, never
// kNoExecutor. Tokens are never reused within a process.
// CHECK-fails if kMaxRegisteredExecutors are already registered.
ExecutorToken RegisterExecutor(std::string_view name);

// Releases `token`. No-op for kNoExecutor or an unknown token.
void UnregisterExecutor(ExecutorToken token);

// Returns the name `token` was registered with,
// or nullptr if `token` is not registered.
// Async-signal-safe.
const char *ExecutorNameForToken(ExecutorToken token);

// What a signal handler knows about the run in flight on its thread.
struct CrashContext {
  // kNoExecutor if no harness is running on this thread.
  ExecutorToken token = kNoExecutor;
  // The bytes passed to the running harness. Only valid if token is set.
  const uint8_t *data = nullptr;
  size_t size = 0;
};

// Returns the calling thread's crash context.
// Async-signal-safe.
CrashContext CurrentCrashContext();

// Publishes {`token`, `data`} in the calling thread's crash-context slot
// for the lifetime of the object. The previous context (normally empty)
// is restored in DTOR, however the scope is left.
// `data` must outlive the object.
class ScopedCrashContext {
 public:
  ScopedCrashContext(ExecutorToken token, absl::Span<const uint8_t> data);
  ~ScopedCrashContext();

  ScopedCrashContext(const ScopedCrashContext &) = delete;
  ScopedCrashContext &operator=(const ScopedCrashContext &) = delete;

 private:
  const CrashContext saved_;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_CRASH_CONTEXT_H_
