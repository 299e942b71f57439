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

// Features are the unit of feedback produced by observers.
// A feature is an integer that represents some property of one execution,
// e.g. "the edge #42 was executed 5 times".

#ifndef THIRD_PARTY_FERRET_FEATURE_H_
#define THIRD_PARTY_FERRET_FEATURE_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace ferret {

using feature_t = uint64_t;
using FeatureVec = std::vector<feature_t>;

// Converts an 8-bit counter `counter_value` for the edge `counter_index` into
// a number. Counter values are bucketed by their log2, so that the counters
// {1}, {2,3}, {4..7}, ... {128..255} produce 8 distinct numbers per edge.
// `counter_value` must be non-zero; zero traps.
inline size_t Convert8bitCounterToNumber(size_t counter_index,
                                         uint8_t counter_value) {
  if (counter_value == 0) __builtin_trap();  // __builtin_clz is UB for 0.
  const size_t value_log2 = 31 - __builtin_clz(counter_value);
  return counter_index * 8 + value_log2;
}

// Calls `action(index, value)` for every non-zero byte in
// [bytes, bytes + num_bytes). Zero words are skipped 8 bytes at a time.
template <typename Action>
void ForEachNonZeroByte(const uint8_t *bytes, size_t num_bytes,
                        Action action) {
  size_t i = 0;
  for (; i + sizeof(uint64_t) <= num_bytes; i += sizeof(uint64_t)) {
    uint64_t word;
    memcpy(&word, bytes + i, sizeof(word));
    if (!word) continue;
    for (size_t j = i; j < i + sizeof(uint64_t); ++j) {
      if (bytes[j]) action(j, bytes[j]);
    }
  }
  for (; i < num_bytes; ++i) {
    if (bytes[i]) action(i, bytes[i]);
  }
}

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_FEATURE_H_
