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

#include "seekext/async/poll.h"

namespace seekext {

/**
 * Seek capability for streams that may not be able to complete a request
 * immediately.
 *
 * The first poll for a request starts it. While the request is in flight the
 * poll returns `std::nullopt` and the implementation arranges for the most
 * recently passed `Waker` to be invoked when the request makes progress. The
 * caller then polls again with the same arguments until a result is
 * returned. Each returned result completes exactly one request.
 */
class AsyncSeeker {
 public:
  virtual ~AsyncSeeker() = default;

  // Has the semantics of lseek(2) with SEEK_SET once ready
  virtual PollResult<uint64_t> PollSeekSet(const Waker& waker,
                                           uint64_t offset) = 0;
  // Has the semantics of lseek(2) with SEEK_CUR once ready
  virtual PollResult<uint64_t> PollSeekCur(const Waker& waker,
                                           int64_t offset) = 0;
  // Has the semantics of lseek(2) with SEEK_END once ready
  virtual PollResult<uint64_t> PollSeekEnd(const Waker& waker,
                                           int64_t offset) = 0;
};

}  // namespace seekext
