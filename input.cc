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

#include "./input.h"

#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"

namespace ferret {

absl::Status BytesInput::Deserialize(absl::Span<const uint8_t> data) {
  if (max_size_ != 0 && data.size() > max_size_) {
    return absl::InvalidArgumentError(absl::StrCat(
        "input of ", data.size(), " bytes exceeds max_size of ", max_size_));
  }
  bytes_.assign(data.begin(), data.end());
  return absl::OkStatus();
}

}  // namespace ferret
