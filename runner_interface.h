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

// The interface between a libFuzzer-style fuzz target and the Ferret runner.

#ifndef THIRD_PARTY_FERRET_RUNNER_INTERFACE_H_
#define THIRD_PARTY_FERRET_RUNNER_INTERFACE_H_

#include <cstddef>
#include <cstdint>

// Typedefs for the libFuzzer API, https://llvm.org/docs/LibFuzzer.html
using FuzzerTestOneInputCallback = int (*)(const uint8_t *data, size_t size);
using FuzzerInitializeCallback = int (*)(int *argc, char ***argv);

// Reads every file in argv[1:] and runs its contents through an
// InMemoryExecutor that calls `test_one_input_cb`.
// Calls `initialize_cb`, if not nullptr, before the first input.
// Flags must have been parsed already (see runner_main.cc).
// Returns EXIT_SUCCESS if every input ran, EXIT_FAILURE otherwise.
// A crashing or hanging input kills the process, see crash_handler.h.
extern "C" int FerretRunnerMain(int argc, char **argv,
                                FuzzerTestOneInputCallback test_one_input_cb,
                                FuzzerInitializeCallback initialize_cb);

// https://llvm.org/docs/LibFuzzer.html#using-libfuzzer-as-a-library
extern "C" int LLVMFuzzerRunDriver(
    int *argc, char ***argv, FuzzerTestOneInputCallback test_one_input_cb);

#endif  // THIRD_PARTY_FERRET_RUNNER_INTERFACE_H_
