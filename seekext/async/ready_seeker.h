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

#pragma once

#include <stdint.h>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"
#include "seekext/io/io.h"

namespace seekext {

/**
 * Presents a blocking `Seeker` as an `AsyncSeeker`. Every poll runs the seek
 * on the calling thread and is immediately ready.
 */
class ReadyAsyncSeeker : public AsyncSeeker {
 public:
  explicit ReadyAsyncSeeker(Seeker& seeker);

  PollResult<uint64_t> PollSeekSet(const Waker&, uint64_t offset) override;
  PollResult<uint64_t> PollSeekCur(const Waker&, int64_t offset) override;
  PollResult<uint64_t> PollSeekEnd(const Waker&, int64_t offset) override;

 private:
  Seeker* seeker_;
};

}  // namespace seekext
