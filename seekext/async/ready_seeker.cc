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

#include "seekext/async/ready_seeker.h"

#include <stdint.h>

#include "seekext/async/poll.h"
#include "seekext/io/io.h"

namespace seekext {

ReadyAsyncSeeker::ReadyAsyncSeeker(Seeker& seeker) : seeker_(&seeker) {}

PollResult<uint64_t> ReadyAsyncSeeker::PollSeekSet(const Waker&,
                                                   uint64_t offset) {
  return seeker_->SeekSet(offset);
}

PollResult<uint64_t> ReadyAsyncSeeker::PollSeekCur(const Waker&,
                                                   int64_t offset) {
  return seeker_->SeekCur(offset);
}

PollResult<uint64_t> ReadyAsyncSeeker::PollSeekEnd(const Waker&,
                                                   int64_t offset) {
  return seeker_->SeekEnd(offset);
}

}  // namespace seekext
