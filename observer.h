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

#ifndef THIRD_PARTY_FERRET_OBSERVER_H_
#define THIRD_PARTY_FERRET_OBSERVER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "./feature.h"

namespace ferret {

// A pluggable per-run data collector, e.g. a coverage tracker.
//
// The owning executor's user calls Reset() on every observer before a run
// and PostExec() after it. Observers are not called during the run itself.
class Observer {
 public:
  // Not copyable or movable.
  Observer(const Observer &) = delete;
  Observer &operator=(const Observer &) = delete;

  virtual ~Observer() {}

  // Clears the per-run state.
  // An error means the state is unusable for the upcoming run.
  virtual absl::Status Reset() = 0;

  // Collects the results of the run that just completed.
  // An error means the collected data may be incomplete.
  virtual absl::Status PostExec() = 0;

  // A human-readable name, used in logs.
  virtual std::string_view name() const = 0;

 protected:
  Observer() {}
};

// Returns `observer` as a `T`, or nullptr if it is not one.
template <typename T>
const T *ObserverAs(const Observer &observer) {
  return dynamic_cast<const T *>(&observer);
}
template <typename T>
T *ObserverAs(Observer &observer) {
  return dynamic_cast<T *>(&observer);
}

// Observes an array of 8-bit edge counters, such as the one created by
// -fsanitize-coverage=inline-8bit-counters. The array is owned elsewhere.
class CounterMapObserver : public Observer {
 public:
  explicit CounterMapObserver(std::string name,
                              absl::Span<uint8_t> map = {})
      : name_(std::move(name)), map_(map) {}

  // Zeroes the map.
  absl::Status Reset() override;
  // Converts every non-zero counter into a feature, see
  // Convert8bitCounterToNumber(). Old features are discarded.
  absl::Status PostExec() override;
  std::string_view name() const override { return name_; }

  // (Re)attaches the observer to `map`. Clears features().
  void SetMap(absl::Span<uint8_t> map) {
    map_ = map;
    features_.clear();
  }

  absl::Span<const uint8_t> map() const { return map_; }
  // Features collected by the most recent successful PostExec().
  const FeatureVec &features() const { return features_; }

 private:
  const std::string name_;
  absl::Span<uint8_t> map_;
  FeatureVec features_;
};

}  // namespace ferret

#endif  // THIRD_PARTY_FERRET_OBSERVER_H_
