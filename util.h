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

#ifndef THIRD_PARTY_FERRET_UTIL_H_
#define THIRD_PARTY_FERRET_UTIL_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/types/span.h"
#include "./defs.h"

namespace ferret {

// Returns a printable string representing at most `max_len` bytes of `data`.
std::string AsString(absl::Span<const uint8_t> data, size_t max_len = 16);
// Reads from a local file `file_path` into `data`.
// Leaves `data` empty if the file can't be opened; crashes on read errors.
void ReadFromLocalFile(std::string_view file_path, ByteArray &data);
// Writes the contents of `data` to a local file `file_path`.
// Crashes on any error.
void WriteToLocalFile(std::string_view file_path,
                      absl::Span<const uint8_t> data);
// Same as above.
void WriteToLocalFile(std::string_view file_path, std::string_view data);

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_UTIL_H_
