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

#ifndef THIRD_PARTY_FERRET_INTERNAL_TEST_UTIL_H_
#define THIRD_PARTY_FERRET_INTERNAL_TEST_UTIL_H_

#include <unistd.h>

#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/str_cat.h"
#include "./logging.h"

#define EXPECT_OK(status) EXPECT_TRUE((status).ok()) << VV(status)
#define ASSERT_OK(status) ASSERT_TRUE((status).ok()) << VV(status)

namespace ferret {

// Returns a temp dir for use inside tests. The base dir is chosen in the
// following order of precedence:
// - $TEST_TMPDIR (highest)
// - $TMPDIR
// - /tmp
std::string GetTestTempDir();

// Creates a tmp dir in CTOR, removes it in DTOR.
// The dir name will contain `name`.
struct ScopedTempDir {
  explicit ScopedTempDir(std::string_view name = "")
      : path(std::filesystem::path(GetTestTempDir())
                 .append(absl::StrCat("ferret_", std::string(name), getpid()))) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~ScopedTempDir() { std::filesystem::remove_all(path); }
  std::string GetFilePath(std::string_view file_name) {
    return std::filesystem::path(path).append(file_name);
  }
  std::string path;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_INTERNAL_TEST_UTIL_H_
