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

#ifndef THIRD_PARTY_FERRET_ENVIRONMENT_H_
#define THIRD_PARTY_FERRET_ENVIRONMENT_H_

#include <cstddef>
#include <string>
#include <vector>

namespace ferret {

// Execution environment that is initialized at startup and doesn't change.
// Data fields are copied from the FLAGS defined in environment.cc.
// See FLAGS descriptions for comments.
// Users or tests can override any of the fields after the object
// is constructed, but before it is passed to an executor.
struct Environment {
  explicit Environment(const std::vector<std::string> &argv = {});

  Environment(int argc, char **argv)
      : Environment(std::vector<std::string>{argv, argv + argc}) {}

  std::string executor_name;
  int timeout_signal;
  size_t max_len;

  // Set to zero to reduce logging in tests.
  size_t log_level = 1;

  std::string exec_name;          // copied from argv[0]
  std::vector<std::string> args;  // copied from argv[1:].
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_ENVIRONMENT_H_
