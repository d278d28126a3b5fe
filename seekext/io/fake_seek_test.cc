//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "seekext/io/fake_seek.h"

#include <stdint.h>

#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "seekext/result/result_matchers.h"
#include "seekext/result/result_type.h"

namespace seekext {
namespace {

TEST(FakeSeekTest, SeekUpdatesPos) {
  FakeSeeker seeker(8);

  for (uint64_t i = 0; i < 8; i++) {
    EXPECT_THAT(seeker.SeekCur(1), IsOkAndValue(i + 1));
  }
}

TEST(FakeSeekTest, SeekEnd) {
  FakeSeeker seeker(8);

  EXPECT_THAT(seeker.SeekEnd(-1), IsOkAndValue(7));
}

TEST(FakeSeekTest, SeekSet) {
  FakeSeeker seeker(8);

  EXPECT_THAT(seeker.SeekSet(2), IsOkAndValue(2));
}

TEST(FakeSeekTest, SeekPastEndKeepsLength) {
  FakeSeeker seeker(8);

  EXPECT_THAT(seeker.SeekEnd(4), IsOkAndValue(12));
  EXPECT_THAT(seeker.SeekCur(1), IsOkAndValue(13));
  EXPECT_EQ(seeker.Length(), 8u);
  EXPECT_THAT(seeker.SeekEnd(0), IsOkAndValue(8));
}

TEST(FakeSeekTest, SeekBeforeStartFails) {
  FakeSeeker seeker(8);
  ASSERT_THAT(seeker.SeekSet(3), IsOkAndValue(3));

  EXPECT_THAT(seeker.SeekCur(-4), IsError());
  EXPECT_THAT(seeker.SeekEnd(-9), IsError());
  EXPECT_THAT(seeker.SeekCur(0), IsOkAndValue(3));
}

TEST(FakeSeekTest, SeekPastMaxOffsetFails) {
  constexpr uint64_t kMaxOffset = std::numeric_limits<uint64_t>::max();
  FakeSeeker seeker(kMaxOffset);
  ASSERT_THAT(seeker.SeekSet(kMaxOffset), IsOkAndValue(kMaxOffset));

  EXPECT_THAT(seeker.SeekCur(1), IsError());
  EXPECT_THAT(seeker.SeekEnd(1), IsError());
  EXPECT_THAT(seeker.SeekCur(0), IsOkAndValue(kMaxOffset));
  EXPECT_THAT(seeker.SeekEnd(-1), IsOkAndValue(kMaxOffset - 1));
}

TEST(FakeSeekTest, SeekToStartFromEnd) {
  FakeSeeker seeker(8);

  EXPECT_THAT(seeker.SeekEnd(-8), IsOkAndValue(0));
}

}  // namespace
}  // namespace seekext
