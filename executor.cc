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

#include "./executor.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "./logging.h"
#include "./observer.h"

namespace ferret {

namespace {

// Calls `step` on every observer in `observers`, in order.
// Returns the first non-OK status; later failures are only logged.
template <typename Step>
absl::Status ForEachObserver(
    const std::vector<std::unique_ptr<Observer>> &observers,
    const char *step_name, Step step) {
  absl::Status first_error;
  for (const auto &observer : observers) {
    absl::Status status = step(*observer);
    if (status.ok()) continue;
    if (first_error.ok()) {
      first_error = std::move(status);
    } else {
      LOG(WARNING) << step_name << " failed for observer '"
                   << observer->name() << "', dropping error: " << status;
    }
  }
  return first_error;
}

}  // namespace

const char *ExitKindToString(ExitKind exit_kind) {
  switch (exit_kind) {
    case ExitKind::kOk:
      return "ok";
    case ExitKind::kCrash:
      return "crash";
    case ExitKind::kOom:
      return "oom";
    case ExitKind::kTimeout:
      return "timeout";
  }
  return "unknown";
}

absl::Status Executor::ResetObservers() {
  return ForEachObserver(observers_, "Reset",
                         [](Observer &observer) { return observer.Reset(); });
}

absl::Status Executor::PostExecObservers() {
  return ForEachObserver(
      observers_, "PostExec",
      [](Observer &observer) { return observer.PostExec(); });
}

}  // namespace ferret
