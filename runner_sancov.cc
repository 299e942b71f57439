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

// Instrumentation callbacks for SanitizerCoverage (sancov).
// https://clang.llvm.org/docs/SanitizerCoverage.html

#include <stdio.h>

#include <cstdint>

#include "./runner.h"

using ferret::state;

extern "C" {

// This function is called at the DSO init time, once per instrumented DSO.
// Only the first non-empty counter array is observed.
// TODO(ferret): observe the counters of every DSO, not just the first.
void __sanitizer_cov_8bit_counters_init(uint8_t *beg, uint8_t *end) {
  if (beg == end) return;
  if (state.counters_beg != state.counters_end) {
    fprintf(stderr, "ignoring extra 8-bit counters: %p..%p\n",
            static_cast<void *>(beg), static_cast<void *>(end));
    return;
  }
  state.counters_beg = beg;
  state.counters_end = end;
}

}  // extern "C"
