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

#include <stddef.h>
#include <stdint.h>

#include <optional>
#include <vector>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"
#include "seekext/io/io.h"
#include "seekext/io/seek_request.h"

namespace seekext {

/**
 * `AsyncSeeker` over a blocking `Seeker` that answers the first
 * `pending_polls` polls of every request with "not ready" before forwarding
 * the request on the next poll.
 *
 * Pending polls either wake the waker right away or keep it for `WakeAll()`,
 * depending on `wake_immediately`.
 */
class ScriptedAsyncSeeker : public AsyncSeeker {
 public:
  ScriptedAsyncSeeker(Seeker& inner, size_t pending_polls,
                      bool wake_immediately = true);

  PollResult<uint64_t> PollSeekSet(const Waker&, uint64_t offset) override;
  PollResult<uint64_t> PollSeekCur(const Waker&, int64_t offset) override;
  PollResult<uint64_t> PollSeekEnd(const Waker&, int64_t offset) override;

  // Wakes every waker kept since the last call.
  void WakeAll();

  // Requests in the order their first poll arrived.
  const std::vector<SeekRequest>& Started() const { return started_; }
  // Requests in the order they were forwarded to the inner Seeker.
  const std::vector<SeekRequest>& Issued() const { return issued_; }
  size_t Polls() const { return polls_; }
  // Polls for a request other than the one still pending.
  size_t MismatchedPolls() const { return mismatched_polls_; }

 private:
  PollResult<uint64_t> PollRequest(const Waker&, const SeekRequest&);

  Seeker* inner_;
  size_t pending_polls_;
  bool wake_immediately_;

  std::optional<SeekRequest> in_flight_;
  size_t remaining_pending_ = 0;
  std::vector<Waker> kept_wakers_;

  std::vector<SeekRequest> started_;
  std::vector<SeekRequest> issued_;
  size_t polls_ = 0;
  size_t mismatched_polls_ = 0;
};

}  // namespace seekext
