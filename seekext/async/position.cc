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

#include "seekext/async/position.h"

#include <stdint.h>

#include <android-base/logging.h>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"

namespace seekext {

StreamPositionFuture::StreamPositionFuture(AsyncSeeker& seeker)
    : seeker_(&seeker) {}

PollResult<uint64_t> StreamPositionFuture::Poll(const Waker& waker) {
  CHECK(!done_) << "StreamPositionFuture polled after completion";
  PollResult<uint64_t> position = seeker_->PollSeekCur(waker, 0);
  if (position) {
    done_ = true;
  }
  return position;
}

StreamPositionFuture AsyncStreamPosition(AsyncSeeker& seeker) {
  return StreamPositionFuture(seeker);
}

}  // namespace seekext
