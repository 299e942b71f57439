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

#include "./runner.h"

#include <signal.h>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "absl/types/span.h"
#include "./defs.h"
#include "./environment.h"
#include "./in_memory_executor.h"
#include "./runner_interface.h"
#include "./test_util.h"
#include "./util.h"

namespace ferret {
namespace {

std::vector<ByteArray> *recorded_inputs = nullptr;

int RecordInput(const uint8_t *data, size_t size) {
  recorded_inputs->emplace_back(data, data + size);
  return 0;
}

int RejectInput(const uint8_t *, size_t) { return -1; }

int CrashOnInput(const uint8_t *data, size_t size) {
  if (size > 0 && data[0] == 'X') raise(SIGSEGV);
  return 0;
}

Environment QuietEnvironment() {
  Environment env;
  env.log_level = 0;
  return env;
}

TEST(Runner, RunInputFile) {
  ScopedTempDir temp_dir;
  const std::string path = temp_dir.GetFilePath("input");
  WriteToLocalFile(path, "abcdef");

  Environment env = QuietEnvironment();
  env.max_len = 4;
  std::vector<ByteArray> seen_inputs;
  InMemoryExecutor executor(
      [&](const Executor &, absl::Span<const uint8_t> data) {
        seen_inputs.emplace_back(data.begin(), data.end());
        return ExitKind::kOk;
      },
      env);
  EXPECT_TRUE(RunInputFile(path, env, executor));
  // The input is truncated to max_len.
  ASSERT_EQ(seen_inputs.size(), 1);
  EXPECT_EQ(seen_inputs[0], ByteArray({'a', 'b', 'c', 'd'}));
  EXPECT_EQ(executor.num_runs(), 1);
}

TEST(Runner, RunInputFileFailsOnMissingFile) {
  ScopedTempDir temp_dir;
  Environment env = QuietEnvironment();
  int num_harness_calls = 0;
  InMemoryExecutor executor(
      [&](const Executor &, absl::Span<const uint8_t>) {
        ++num_harness_calls;
        return ExitKind::kOk;
      },
      env);
  EXPECT_FALSE(
      RunInputFile(temp_dir.GetFilePath("no_such_file"), env, executor));
  // A directory is not an input file either.
  EXPECT_FALSE(RunInputFile(temp_dir.path, env, executor));
  EXPECT_EQ(num_harness_calls, 0);
}

TEST(Runner, FerretRunnerMainRunsEveryInput) {
  ScopedTempDir temp_dir;
  const std::string path1 = temp_dir.GetFilePath("in1");
  const std::string path2 = temp_dir.GetFilePath("in2");
  WriteToLocalFile(path1, "foo");
  WriteToLocalFile(path2, "");

  std::vector<ByteArray> inputs;
  recorded_inputs = &inputs;
  std::string argv0 = "runner";
  std::vector<char *> argv = {argv0.data(), const_cast<char *>(path1.c_str()),
                              const_cast<char *>(path2.c_str())};
  EXPECT_EQ(FerretRunnerMain(argv.size(), argv.data(), RecordInput, nullptr),
            EXIT_SUCCESS);
  recorded_inputs = nullptr;
  ASSERT_EQ(inputs.size(), 2);
  EXPECT_EQ(inputs[0], ByteArray({'f', 'o', 'o'}));
  EXPECT_TRUE(inputs[1].empty());
}

TEST(Runner, RejectedInputsAreNotFailures) {
  ScopedTempDir temp_dir;
  const std::string path = temp_dir.GetFilePath("in");
  WriteToLocalFile(path, "-1");
  std::string argv0 = "runner";
  std::vector<char *> argv = {argv0.data(), const_cast<char *>(path.c_str())};
  int argc = argv.size();
  char **argv_ptr = argv.data();
  EXPECT_EQ(LLVMFuzzerRunDriver(&argc, &argv_ptr, RejectInput), EXIT_SUCCESS);
}

TEST(Runner, FerretRunnerMainFailsOnMissingInput) {
  std::string argv0 = "runner";
  std::string missing = "/no/such/input/file";
  std::vector<char *> argv = {argv0.data(), missing.data()};
  EXPECT_EQ(FerretRunnerMain(argv.size(), argv.data(), RejectInput, nullptr),
            EXIT_FAILURE);
}

TEST(RunnerDeathTest, CrashingInputIsReported) {
  ScopedTempDir temp_dir;
  const std::string path = temp_dir.GetFilePath("crasher");
  WriteToLocalFile(path, "X marks the spot");
  std::string argv0 = "runner";
  std::vector<char *> argv = {argv0.data(), const_cast<char *>(path.c_str())};
  EXPECT_EXIT(FerretRunnerMain(argv.size(), argv.data(), CrashOnInput, nullptr),
              testing::KilledBySignal(SIGSEGV),
              "Target crashed: SIGSEGV in executor 'in_memory'.*"
              "input of 16 bytes");
}

}  // namespace
}  // namespace ferret
