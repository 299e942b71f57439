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

#ifndef THIRD_PARTY_FERRET_INPUT_H_
#define THIRD_PARTY_FERRET_INPUT_H_

#include <cstddef>
#include <cstdint>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "./defs.h"

namespace ferret {

// One fuzz case. An Input has a canonical byte representation, which is what
// the executor feeds to the harness.
//
// Users inherit from this class to define structured inputs.
class Input {
 public:
  virtual ~Input() {}

  // Returns the canonical bytes of the current state, or an error status
  // if no such representation exists.
  virtual absl::StatusOr<ByteArray> Serialize() const = 0;

  // Reconstructs the state from `data`.
  // Returns an error status if `data` is malformed.
  virtual absl::Status Deserialize(absl::Span<const uint8_t> data) = 0;
};

// An input that is exactly its bytes.
class BytesInput : public Input {
 public:
  // `max_size` limits what Deserialize() accepts; 0 means no limit.
  explicit BytesInput(ByteArray bytes = {}, size_t max_size = 0)
      : bytes_(std::move(bytes)), max_size_(max_size) {}

  // Never fails.
  absl::StatusOr<ByteArray> Serialize() const override { return bytes_; }

  // Fails with InvalidArgument if `data` is larger than max_size, in which
  // case the old bytes are kept.
  absl::Status Deserialize(absl::Span<const uint8_t> data) override;

  // Accessors.
  const ByteArray &bytes() const { return bytes_; }
  ByteArray &mutable_bytes() { return bytes_; }
  size_t max_size() const { return max_size_; }

 private:
  ByteArray bytes_;
  const size_t max_size_;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_INPUT_H_
