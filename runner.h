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

#ifndef THIRD_PARTY_FERRET_RUNNER_H_
#define THIRD_PARTY_FERRET_RUNNER_H_

#include <cstdint>
#include <string_view>

#include "./environment.h"
#include "./executor.h"

namespace ferret {

// One global object of this type is created by the runner at start up.
// All data members are zero-initialized, so that the sancov callbacks,
// which run before main(), may write to it.
struct GlobalRunnerState {
  // Inline 8-bit counters of the target, if it was built with
  // -fsanitize-coverage=inline-8bit-counters.
  // https://clang.llvm.org/docs/SanitizerCoverage.html#inline-8bit-counters
  // Set by __sanitizer_cov_8bit_counters_init, see runner_sancov.cc.
  uint8_t *counters_beg;
  uint8_t *counters_end;
};

extern GlobalRunnerState state;

// Reads the file `input_path`, truncated to `env.max_len`, and runs it
// through `executor`, resetting the observers before and collecting them
// after. Returns false if the file can't be read or any step fails.
bool RunInputFile(std::string_view input_path, const Environment &env,
                  Executor &executor);

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_RUNNER_H_
