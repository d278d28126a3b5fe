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

#include "seekext/io/length.h"

#include <stdint.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "seekext/io/fake_seek.h"
#include "seekext/io/position.h"
#include "seekext/io/seek_request.h"
#include "seekext/result/result_matchers.h"
#include "seekext/result/result_type.h"
#include "seekext/testing/recording_seeker.h"

namespace seekext {
namespace {

using ::testing::ElementsAre;
using ::testing::StrEq;

TEST(LengthTest, LengthEmpty) {
  FakeSeeker seeker(0);
  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(0));
  ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(0));
}

TEST(LengthTest, AtStart) {
  FakeSeeker seeker(15);

  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(0));
}

TEST(LengthTest, AtEnd) {
  FakeSeeker seeker(15);

  ASSERT_THAT(seeker.SeekEnd(0), IsOkAndValue(15));
  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(15));
}

TEST(LengthTest, ResetsSeekPos) {
  FakeSeeker seeker(15);

  ASSERT_THAT(seeker.SeekSet(7), IsOkAndValue(7));
  ASSERT_THAT(seeker.SeekCur(2), IsOkAndValue(9));
  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(9));
}

TEST(LengthTest, ResetsSeekPosPastEnd) {
  FakeSeeker seeker(15);

  ASSERT_THAT(seeker.SeekSet(20), IsOkAndValue(20));
  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(20));
}

TEST(LengthTest, ResetsEveryStartingPosition) {
  for (uint64_t start = 0; start <= 16; start++) {
    FakeSeeker seeker(16);
    ASSERT_THAT(seeker.SeekSet(start), IsOkAndValue(start));
    ASSERT_THAT(StreamLen(seeker), IsOkAndValue(16));
    ASSERT_THAT(StreamPosition(seeker), IsOkAndValue(start));
  }
}

TEST(LengthTest, SeeksThreeTimesBeforeEnd) {
  FakeSeeker fake(15);
  ASSERT_THAT(fake.SeekSet(4), IsOkAndValue(4));
  RecordingSeeker seeker(fake);

  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  EXPECT_THAT(seeker.Requests(),
              ElementsAre(SeekRequest::Cur(0), SeekRequest::End(0),
                          SeekRequest::Set(4)));
}

TEST(LengthTest, SkipsSeekBackAtEnd) {
  FakeSeeker fake(15);
  ASSERT_THAT(fake.SeekEnd(0), IsOkAndValue(15));
  RecordingSeeker seeker(fake);

  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
  EXPECT_THAT(seeker.Requests(),
              ElementsAre(SeekRequest::Cur(0), SeekRequest::End(0)));
}

TEST(LengthTest, PositionFailurePropagates) {
  FakeSeeker fake(15);
  RecordingSeeker seeker(fake);
  seeker.FailOn(Whence::kCur, "position unavailable");

  Result<uint64_t> len = StreamLen(seeker);

  ASSERT_THAT(len, IsErrorAndMessage(StrEq("position unavailable")));
  EXPECT_THAT(seeker.Requests(), ElementsAre(SeekRequest::Cur(0)));
}

TEST(LengthTest, EndSeekFailureReturnsSameError) {
  FakeSeeker fake(15);
  ASSERT_THAT(fake.SeekSet(3), IsOkAndValue(3));
  RecordingSeeker seeker(fake);
  seeker.FailOn(Whence::kEnd, "device went away");

  Result<uint64_t> len = StreamLen(seeker);

  ASSERT_THAT(len, IsErrorAndMessage(StrEq("device went away")));
  // Returned as produced, without an extra stack entry.
  EXPECT_THAT(len, IsErrorWithStackDepth(1));
  EXPECT_THAT(seeker.Requests(),
              ElementsAre(SeekRequest::Cur(0), SeekRequest::End(0)));
}

TEST(LengthTest, RestoreFailurePropagates) {
  FakeSeeker fake(15);
  ASSERT_THAT(fake.SeekSet(3), IsOkAndValue(3));
  RecordingSeeker seeker(fake);
  seeker.FailOn(Whence::kSet, "restore failed");

  Result<uint64_t> len = StreamLen(seeker);

  ASSERT_THAT(len, IsErrorAndMessage(StrEq("restore failed")));
  EXPECT_THAT(len, IsErrorWithStackDepth(1));
  EXPECT_THAT(seeker.Requests(),
              ElementsAre(SeekRequest::Cur(0), SeekRequest::End(0),
                          SeekRequest::Set(3)));
}

TEST(LengthTest, RestoreFailureNotReachableAtEnd) {
  FakeSeeker fake(15);
  ASSERT_THAT(fake.SeekEnd(0), IsOkAndValue(15));
  RecordingSeeker seeker(fake);
  seeker.FailOn(Whence::kSet, "restore failed");

  ASSERT_THAT(StreamLen(seeker), IsOkAndValue(15));
}

}  // namespace
}  // namespace seekext
