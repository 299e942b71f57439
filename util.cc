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

#include "./util.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>

#include "absl/types/span.h"
#include "./defs.h"
#include "./logging.h"

namespace ferret {

std::string AsString(absl::Span<const uint8_t> data, size_t max_len) {
  std::ostringstream out;
  size_t len = std::min(max_len, data.size());
  for (size_t i = 0; i < len; ++i) {
    const uint8_t ch = data[i];
    if (std::isprint(ch)) {
      out << static_cast<char>(ch);
    } else {
      out << "\\x" << std::uppercase << std::hex
          << static_cast<uint32_t>(ch) << std::dec;
    }
  }
  return out.str();
}

void ReadFromLocalFile(std::string_view file_path, ByteArray &data) {
  data.clear();
  std::ifstream f(std::string{file_path}, std::ios::binary);
  if (!f) return;
  f.seekg(0, std::ios_base::end);
  size_t size = f.tellg();
  f.seekg(0, std::ios_base::beg);
  data.resize(size);
  f.read(reinterpret_cast<char *>(data.data()), size);
  CHECK(f) << "Failed to read from local file: " << file_path;
}

void WriteToLocalFile(std::string_view file_path,
                      absl::Span<const uint8_t> data) {
  std::ofstream f(std::string{file_path}, std::ios::binary);
  CHECK(f) << "Failed to open local file: " << file_path;
  f.write(reinterpret_cast<const char *>(data.data()), data.size());
  CHECK(f) << "Failed to write to local file: " << file_path;
}

void WriteToLocalFile(std::string_view file_path, std::string_view data) {
  static_assert(sizeof(decltype(data)::value_type) == sizeof(uint8_t));
  WriteToLocalFile(file_path, absl::Span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(data.data()), data.size()));
}

}  // namespace ferret
