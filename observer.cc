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

#include "./observer.h"

#include <cstdint>
#include <cstring>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "./feature.h"

namespace ferret {

absl::Status CounterMapObserver::Reset() {
  if (map_.empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat(name_, ": no counter map attached"));
  }
  memset(map_.data(), 0, map_.size());
  return absl::OkStatus();
}

absl::Status CounterMapObserver::PostExec() {
  if (map_.empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat(name_, ": no counter map attached"));
  }
  features_.clear();
  ForEachNonZeroByte(map_.data(), map_.size(),
                     [this](size_t idx, uint8_t value) {
                       features_.push_back(
                           Convert8bitCounterToNumber(idx, value));
                     });
  return absl::OkStatus();
}

}  // namespace ferret
