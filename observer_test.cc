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

#include "./observer.h"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/types/span.h"
#include "./feature.h"
#include "./test_util.h"

namespace ferret {
namespace {

TEST(CounterMapObserver, ResetZeroesTheMap) {
  std::vector<uint8_t> counters = {1, 0, 5, 255};
  CounterMapObserver observer("counters", absl::MakeSpan(counters));
  EXPECT_EQ(observer.name(), "counters");
  EXPECT_OK(observer.Reset());
  EXPECT_EQ(counters, std::vector<uint8_t>({0, 0, 0, 0}));
}

TEST(CounterMapObserver, PostExecCollectsNonZeroCounters) {
  // Longer than 8 bytes, to exercise both the word and the tail loops.
  std::vector<uint8_t> counters(21);
  CounterMapObserver observer("counters", absl::MakeSpan(counters));
  ASSERT_OK(observer.Reset());
  counters[0] = 1;
  counters[9] = 3;
  counters[20] = 200;
  EXPECT_OK(observer.PostExec());
  EXPECT_EQ(observer.features(),
            FeatureVec({Convert8bitCounterToNumber(0, 1),
                        Convert8bitCounterToNumber(9, 3),
                        Convert8bitCounterToNumber(20, 200)}));

  // The next run replaces the features.
  ASSERT_OK(observer.Reset());
  EXPECT_OK(observer.PostExec());
  EXPECT_TRUE(observer.features().empty());
}

TEST(CounterMapObserver, FailsWithoutAMap) {
  CounterMapObserver observer("detached");
  EXPECT_EQ(observer.Reset().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(observer.PostExec().code(), absl::StatusCode::kFailedPrecondition);

  std::vector<uint8_t> counters = {7};
  observer.SetMap(absl::MakeSpan(counters));
  EXPECT_OK(observer.Reset());
  EXPECT_OK(observer.PostExec());
}

TEST(Feature, Convert8bitCounterToNumber) {
  // Counter values are bucketed by log2.
  EXPECT_EQ(Convert8bitCounterToNumber(0, 1), 0);
  EXPECT_EQ(Convert8bitCounterToNumber(0, 2), 1);
  EXPECT_EQ(Convert8bitCounterToNumber(0, 3), 1);
  EXPECT_EQ(Convert8bitCounterToNumber(0, 4), 2);
  EXPECT_EQ(Convert8bitCounterToNumber(0, 255), 7);
  EXPECT_EQ(Convert8bitCounterToNumber(10, 1), 80);
  EXPECT_EQ(Convert8bitCounterToNumber(10, 128), 87);
}

TEST(FeatureDeathTest, ZeroCounterTraps) {
  EXPECT_DEATH(Convert8bitCounterToNumber(0, 0), "");
  EXPECT_DEATH(Convert8bitCounterToNumber(3, 0), "");
}

class OtherObserver : public Observer {
 public:
  absl::Status Reset() override { return absl::OkStatus(); }
  absl::Status PostExec() override { return absl::OkStatus(); }
  std::string_view name() const override { return "other"; }
};

TEST(Observer, ObserverAs) {
  std::unique_ptr<Observer> counters =
      std::make_unique<CounterMapObserver>("counters");
  std::unique_ptr<Observer> other = std::make_unique<OtherObserver>();

  EXPECT_NE(ObserverAs<CounterMapObserver>(*counters), nullptr);
  EXPECT_EQ(ObserverAs<CounterMapObserver>(*counters)->name(), "counters");
  EXPECT_EQ(ObserverAs<CounterMapObserver>(*other), nullptr);
  EXPECT_NE(ObserverAs<OtherObserver>(*other), nullptr);

  const Observer &const_counters = *counters;
  EXPECT_NE(ObserverAs<CounterMapObserver>(const_counters), nullptr);
}

}  // namespace
}  // namespace ferret
