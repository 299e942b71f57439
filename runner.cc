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

// In-process fuzz target runner for Ferret.
// Reads the input files and feeds their contents to the fuzz target
// (LLVMFuzzerTestOneInput) through an InMemoryExecutor, collecting coverage
// from the target's inline 8-bit counters when the target has them.
#include "./runner.h"

#include <cstdint>
#include <cstdlib>
#include <filesystem>  // NOLINT
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./environment.h"
#include "./executor.h"
#include "./in_memory_executor.h"
#include "./input.h"
#include "./logging.h"
#include "./observer.h"
#include "./runner_interface.h"
#include "./util.h"

namespace ferret {

GlobalRunnerState state;

bool RunInputFile(std::string_view input_path, const Environment &env,
                  Executor &executor) {
  if (!std::filesystem::is_regular_file(input_path)) {
    LOG(ERROR) << "Can't open the input file: " << input_path;
    return false;
  }
  ByteArray bytes;
  ReadFromLocalFile(input_path, bytes);
  if (bytes.size() > env.max_len) bytes.resize(env.max_len);
  if (env.log_level > 0) {
    LOG(INFO) << "Running " << input_path << " " << VV(bytes.size())
              << "data=" << AsString(bytes);
  }
  executor.PlaceInput(std::make_unique<BytesInput>(std::move(bytes)));

  if (absl::Status status = executor.ResetObservers(); !status.ok()) {
    LOG(ERROR) << "Failed to reset observers: " << status;
    return false;
  }
  absl::StatusOr<ExitKind> exit_kind = executor.RunTarget();
  if (!exit_kind.ok()) {
    LOG(ERROR) << "Failed to run " << input_path << ": " << exit_kind.status();
    return false;
  }
  if (absl::Status status = executor.PostExecObservers(); !status.ok()) {
    LOG(ERROR) << "Failed to collect observers: " << status;
    return false;
  }
  if (env.log_level > 1) {
    if (auto *coverage = executor.FindObserver<CounterMapObserver>()) {
      LOG(INFO) << input_path << " " << VV(coverage->features().size());
    }
  }
  return true;
}

}  // namespace ferret

extern "C" int FerretRunnerMain(
    int argc, char **argv, FuzzerTestOneInputCallback test_one_input_cb,
    FuzzerInitializeCallback initialize_cb) {
  using ferret::state;

  ferret::Environment env(argc, argv);
  if (env.log_level > 0) {
    LOG(INFO) << "Ferret in-process runner; argv[0]: " << env.exec_name << " "
              << VV(env.args.size());
  }

  // All further actions will execute code in the target,
  // so we need to call LLVMFuzzerInitialize.
  if (initialize_cb) {
    initialize_cb(&argc, &argv);
  }

  ferret::InMemoryExecutor executor(
      [test_one_input_cb](const ferret::Executor &,
                          absl::Span<const uint8_t> data) {
        // A return value of -1 rejects the input from the corpus; for the
        // executor it is still a normal completion.
        test_one_input_cb(data.data(), data.size());
        return ferret::ExitKind::kOk;
      },
      env);
  if (state.counters_beg != state.counters_end) {
    executor.AddObserver(std::make_unique<ferret::CounterMapObserver>(
        "inline-8bit-counters",
        absl::MakeSpan(state.counters_beg, state.counters_end)));
  }

  for (const std::string &input_path : env.args) {
    if (!ferret::RunInputFile(input_path, env, executor)) return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

extern "C" int LLVMFuzzerRunDriver(
    int *argc, char ***argv, FuzzerTestOneInputCallback test_one_input_cb) {
  return FerretRunnerMain(*argc, *argv, test_one_input_cb, nullptr);
}
