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

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/flags/parse.h"
#include "./runner_interface.h"

// This is the header-less interface of libFuzzer, see
// https://llvm.org/docs/LibFuzzer.html.
extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
__attribute__((weak)) int LLVMFuzzerInitialize(int *argc, char ***argv);
}  // extern "C"

// Returns FerretRunnerMain() with the default fuzzer callbacks.
int main(int argc, char **argv) {
  // Ferret flags are removed; what is left is passed on to the target.
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  return FerretRunnerMain(static_cast<int>(args.size()), args.data(),
                          LLVMFuzzerTestOneInput, LLVMFuzzerInitialize);
}
