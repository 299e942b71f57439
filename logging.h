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

// A rudimentary logging interface similar to a subset of "base/logging.h".
//
// NOTE: none of this is async-signal-safe. Signal handlers must use
// ABSL_RAW_LOG instead, see crash_handler.cc.

#ifndef THIRD_PARTY_FERRET_LOGGING_H_
#define THIRD_PARTY_FERRET_LOGGING_H_

#include <stdlib.h>

#include <iostream>
#include <string_view>

namespace ferret {

// Severities accepted by LOG(), as the letter that prefixes the line.
// Only FATAL terminates the process.
namespace log_severity {
inline constexpr char INFO = 'I';
inline constexpr char WARNING = 'W';
inline constexpr char ERROR = 'E';
inline constexpr char FATAL = 'F';
}  // namespace log_severity

class TinyLogger {
 public:
  TinyLogger(std::string_view file, int line, char severity)
      : fatal_{severity == log_severity::FATAL} {
    std::cerr << severity << " " << file << ":" << line << "] ";
  }
  ~TinyLogger() {
    std::cerr << std::endl;
    if (fatal_) abort();
  }
  template <typename Type>
  TinyLogger &operator<<(const Type &data) {
    std::cerr << data;
    return *this;
  }

 private:
  const bool fatal_;
};

}  // namespace ferret

#define LOG_IMPL(severity) \
  ::ferret::TinyLogger(__FILE__, __LINE__, (severity))
#undef LOG
#define LOG(severity) LOG_IMPL(::ferret::log_severity::severity)
#undef VLOG
#define VLOG(logging_level) LOG(INFO)  // ignore logging_level

#undef CHECK_COND
   // NOTE: The `if` is intentionally dangling to allow trailing `<<`s.
   // clang-format off
#define CHECK_COND(a, b, cond) \
  if (!((a)cond(b)))                                        \
    LOG(FATAL) << "Check failed: " << #a << #cond << #b     \
               << " [" << (a) << #cond << (b) << "] "
   // clang-format on
#undef CHECK_EQ
#define CHECK_EQ(a, b) CHECK_COND(a, b, ==)
#undef CHECK_NE
#define CHECK_NE(a, b) CHECK_COND(a, b, !=)
#undef CHECK_GT
#define CHECK_GT(a, b) CHECK_COND(a, b, >)
#undef CHECK_GE
#define CHECK_GE(a, b) CHECK_COND(a, b, >=)
#undef CHECK_LT
#define CHECK_LT(a, b) CHECK_COND(a, b, <)
#undef CHECK_LE
#define CHECK_LE(a, b) CHECK_COND(a, b, <=)
#undef CHECK
#define CHECK(condition) CHECK_NE(!!(condition), false)

// Easy variable value logging: LOG(INFO) << VV(foo) << VV(bar);
#define VV(x) #x "=" << (x) << " "

#endif  // THIRD_PARTY_FERRET_LOGGING_H_
