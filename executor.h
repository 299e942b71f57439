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

#ifndef THIRD_PARTY_FERRET_EXECUTOR_H_
#define THIRD_PARTY_FERRET_EXECUTOR_H_

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "./input.h"
#include "./observer.h"

namespace ferret {

// Classification of a harness invocation.
// Only kOk is ever returned by Executor::RunTarget(): a crash or a timeout
// never returns, it is reported by the crash handlers (see crash_handler.h).
enum class ExitKind {
  kOk,
  kCrash,
  kOom,
  kTimeout,
};

// Returns "ok", "crash", etc.
const char *ExitKindToString(ExitKind exit_kind);

// Runs one input at a time against a target and manages the observers that
// collect feedback from those runs.
//
// A typical caller does, for every input:
//   executor.PlaceInput(std::move(input));
//   CHECK(executor.ResetObservers().ok());
//   auto exit_kind = executor.RunTarget();
//   CHECK(executor.PostExecObservers().ok());
//
// Not thread-safe.
class Executor {
 public:
  // Not copyable or movable.
  Executor(const Executor &) = delete;
  Executor &operator=(const Executor &) = delete;

  virtual ~Executor() {}

  // Runs the current input once.
  // Returns FailedPrecondition if there is no current input.
  virtual absl::StatusOr<ExitKind> RunTarget() = 0;

  // Makes `input` the current input, destroying the previous one, if any.
  void PlaceInput(std::unique_ptr<Input> input) {
    cur_input_ = std::move(input);
  }

  // Accessors for the current input. May be nullptr.
  const std::unique_ptr<Input> &cur_input() const { return cur_input_; }
  std::unique_ptr<Input> &mutable_cur_input() { return cur_input_; }

  // Calls Reset() on every observer, in the order they were added.
  // All observers are called even if some fail. Returns the first error.
  absl::Status ResetObservers();

  // Same as ResetObservers(), but calls PostExec().
  absl::Status PostExecObservers();

  // Appends `observer`. Returns it, still owned by `this`.
  Observer *AddObserver(std::unique_ptr<Observer> observer) {
    observers_.push_back(std::move(observer));
    return observers_.back().get();
  }

  const std::vector<std::unique_ptr<Observer>> &observers() const {
    return observers_;
  }

  // Returns the first observer whose concrete type is `T`, or nullptr.
  template <typename T>
  T *FindObserver() {
    for (auto &observer : observers_) {
      if (auto *typed = ObserverAs<T>(*observer)) return typed;
    }
    return nullptr;
  }
  // Harnesses get a const Executor, and can only inspect observers.
  template <typename T>
  const T *FindObserver() const {
    for (const auto &observer : observers_) {
      const Observer &const_observer = *observer;
      if (const T *typed = ObserverAs<T>(const_observer)) return typed;
    }
    return nullptr;
  }

 protected:
  Executor() {}

 private:
  std::unique_ptr<Input> cur_input_;
  std::vector<std::unique_ptr<Observer>> observers_;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_EXECUTOR_H_
