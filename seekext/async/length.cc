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

#include "seekext/async/length.h"

#include <stdint.h>

#include <string_view>
#include <variant>

#include <android-base/logging.h>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"
#include "seekext/async/position.h"
#include "seekext/result/result_type.h"

namespace seekext {

StreamLenFuture::StreamLenFuture(AsyncSeeker& seeker)
    : seeker_(&seeker),
      state_(AwaitingPosition{StreamPositionFuture(seeker)}) {}

PollResult<uint64_t> StreamLenFuture::Poll(const Waker& waker) {
  CHECK(!std::holds_alternative<Done>(state_))
      << "StreamLenFuture polled after completion";
  while (true) {
    if (auto* state = std::get_if<AwaitingPosition>(&state_)) {
      PollResult<uint64_t> old_pos = state->position.Poll(waker);
      if (!old_pos) {
        return std::nullopt;
      }
      if (!old_pos->ok()) {
        state_ = Done{};
        return old_pos;
      }
      state_ = AwaitingEndSeek{**old_pos};
    } else if (auto* state = std::get_if<AwaitingEndSeek>(&state_)) {
      PollResult<uint64_t> len = seeker_->PollSeekEnd(waker, 0);
      if (!len) {
        return std::nullopt;
      }
      if (!len->ok()) {
        state_ = Done{};
        return len;
      }
      if (state->old_pos == **len) {
        LOG(VERBOSE) << "Stream was at its end (" << **len
                     << "), not seeking back";
        state_ = Done{};
        return len;
      }
      state_ = AwaitingRestoreSeek{state->old_pos, **len};
    } else if (auto* state = std::get_if<AwaitingRestoreSeek>(&state_)) {
      PollResult<uint64_t> restored =
          seeker_->PollSeekSet(waker, state->old_pos);
      if (!restored) {
        return std::nullopt;
      }
      Result<uint64_t> len = state->len;
      state_ = Done{};
      if (!restored->ok()) {
        return restored;
      }
      return len;
    } else {
      LOG(FATAL) << "Unhandled state " << StateName();
      return std::nullopt;
    }
    LOG(VERBOSE) << "StreamLenFuture advanced to " << StateName();
  }
}

std::string_view StreamLenFuture::StateName() const {
  if (std::holds_alternative<AwaitingPosition>(state_)) {
    return "AwaitingPosition";
  } else if (std::holds_alternative<AwaitingEndSeek>(state_)) {
    return "AwaitingEndSeek";
  } else if (std::holds_alternative<AwaitingRestoreSeek>(state_)) {
    return "AwaitingRestoreSeek";
  } else {
    return "Done";
  }
}

StreamLenFuture AsyncStreamLen(AsyncSeeker& seeker) {
  return StreamLenFuture(seeker);
}

}  // namespace seekext
