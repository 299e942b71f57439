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

#include "./crash_handler.h"

#include <signal.h>

#include <cstdlib>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "./test_util.h"

namespace ferret {
namespace {

TEST(CrashHandler, RejectsCrashSignalAsTimeoutSignal) {
  for (int signum : kCrashSignals) {
    const absl::Status status = InstallCrashHandlers(signum);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument) << signum;
  }
}

TEST(CrashHandler, RejectsUnhandleableTimeoutSignal) {
  ASSERT_OK(InstallCrashHandlers(SIGUSR2));
  EXPECT_FALSE(InstallCrashHandlers(SIGKILL).ok());
  // The failed installation did not replace the timeout signal.
  EXPECT_EQ(InstalledTimeoutSignal(), SIGUSR2);
}

TEST(CrashHandler, NewTimeoutSignalReleasesTheOldOne) {
  ASSERT_OK(InstallCrashHandlers(SIGUSR2));
  EXPECT_EQ(InstalledTimeoutSignal(), SIGUSR2);
  ASSERT_OK(InstallCrashHandlers(SIGUSR1));
  EXPECT_EQ(InstalledTimeoutSignal(), SIGUSR1);

  struct sigaction action = {};
  ASSERT_EQ(sigaction(SIGUSR2, nullptr, &action), 0);
  EXPECT_EQ(action.sa_handler, SIG_DFL);
  ASSERT_EQ(sigaction(SIGUSR1, nullptr, &action), 0);
  EXPECT_NE(action.sa_flags & SA_SIGINFO, 0);

  ASSERT_OK(InstallCrashHandlers(SIGUSR2));
  ASSERT_EQ(sigaction(SIGUSR1, nullptr, &action), 0);
  EXPECT_EQ(action.sa_handler, SIG_DFL);
}

TEST(CrashHandler, InstallIsIdempotent) {
  EXPECT_OK(InstallCrashHandlers());
  EXPECT_OK(InstallCrashHandlers());
  EXPECT_OK(InstallCrashHandlers(SIGUSR1));
}

TEST(CrashHandler, TimeoutSignalOutsideOfRunsIsIgnored) {
  ASSERT_OK(InstallCrashHandlers(SIGUSR2));
  EXPECT_EQ(raise(SIGUSR2), 0);
  // Still alive.
  SUCCEED();
}

TEST(CrashHandlerDeathTest, CrashOutsideOfRunsIsNotAttributed) {
  EXPECT_EXIT(
      {
        if (!InstallCrashHandlers().ok()) exit(1);
        raise(SIGBUS);
      },
      testing::KilledBySignal(SIGBUS), "SIGBUS.*outside of any target run");
}

TEST(CrashHandlerDeathTest, InstallOrDie) {
  EXPECT_DEATH(InstallCrashHandlersOrDie(SIGSEGV),
               "Failed to install crash handlers.*already handled as a "
               "crash signal");
}

}  // namespace
}  // namespace ferret
