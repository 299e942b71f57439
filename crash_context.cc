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

#include "./crash_context.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./logging.h"

namespace ferret {

namespace {

static_assert(std::atomic<ExecutorToken>::is_always_lock_free,
              "the crash handlers need lock-free token loads");

struct RegistryEntry {
  // kNoExecutor iff the entry is free.
  std::atomic<ExecutorToken> token;
  // Written before `token` is published, never while it is.
  char name[kMaxExecutorNameLength + 1];
};

// Zero-initialized: all entries start out free.
RegistryEntry registry[kMaxRegisteredExecutors];
// Serializes RegisterExecutor()/UnregisterExecutor().
// Readers (signal handlers) never take it.
ABSL_CONST_INIT absl::Mutex registry_mu(absl::kConstInit);
ExecutorToken last_issued_token ABSL_GUARDED_BY(registry_mu) = kNoExecutor;

// One such object lives in every thread's TLS.
// There is no CTOR: the members are zero-initialized at thread creation,
// so a signal handler touching it never triggers a lazy TLS initializer.
struct CrashContextSlot {
  std::atomic<ExecutorToken> token;
  // Only meaningful while `token` != kNoExecutor.
  const uint8_t *data;
  size_t size;
};

thread_local CrashContextSlot slot;

// Stores `context` in `slot`. A handler interrupting this function sees
// either no run or a complete {token, data, size} triple.
void Publish(const CrashContext &context) {
  slot.token.store(kNoExecutor, std::memory_order_relaxed);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  slot.data = context.data;
  slot.size = context.size;
  slot.token.store(context.token, std::memory_order_release);
}

}  // namespace

ExecutorToken RegisterExecutor(std::string_view name) {
  absl::MutexLock lock(&registry_mu);
  for (auto &entry : registry) {
    if (entry.token.load(std::memory_order_relaxed) != kNoExecutor) continue;
    const size_t name_length = std::min(name.size(), kMaxExecutorNameLength);
    memcpy(entry.name, name.data(), name_length);
    entry.name[name_length] = '\0';
    const ExecutorToken token = ++last_issued_token;
    entry.token.store(token, std::memory_order_release);
    return token;
  }
  LOG(FATAL) << "Too many live executors: " << VV(kMaxRegisteredExecutors)
             << VV(name);
  __builtin_unreachable();
}

void UnregisterExecutor(ExecutorToken token) {
  if (token == kNoExecutor) return;
  absl::MutexLock lock(&registry_mu);
  for (auto &entry : registry) {
    if (entry.token.load(std::memory_order_relaxed) != token) continue;
    entry.token.store(kNoExecutor, std::memory_order_release);
    return;
  }
}

const char *ExecutorNameForToken(ExecutorToken token) {
  if (token == kNoExecutor) return nullptr;
  for (const auto &entry : registry) {
    if (entry.token.load(std::memory_order_acquire) == token) return entry.name;
  }
  return nullptr;
}

CrashContext CurrentCrashContext() {
  CrashContext context;
  context.token = slot.token.load(std::memory_order_acquire);
  if (context.token == kNoExecutor) return context;
  context.data = slot.data;
  context.size = slot.size;
  return context;
}

ScopedCrashContext::ScopedCrashContext(ExecutorToken token,
                                       absl::Span<const uint8_t> data)
    : saved_(CurrentCrashContext()) {
  CHECK_NE(token, kNoExecutor);
  Publish({token, data.data(), data.size()});
}

ScopedCrashContext::~ScopedCrashContext() { Publish(saved_); }

}  // namespace ferret
