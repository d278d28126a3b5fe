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

#include <mutex>
#include <optional>
#include <thread>

#include "seekext/async/async_io.h"
#include "seekext/async/poll.h"
#include "seekext/io/io.h"
#include "seekext/io/seek_request.h"
#include "seekext/result/result_type.h"

namespace seekext {

/**
 * Presents a blocking `Seeker` as an `AsyncSeeker` by running each request on
 * a worker thread. Polls return pending until the worker finishes, after which
 * the latest waker is woken and the next poll for the same request returns its
 * result.
 *
 * Polling for a different request than the one in flight, which happens when
 * a query was abandoned part way, waits for the in-flight request, drops its
 * result and starts the new request.
 */
class BackgroundAsyncSeeker : public AsyncSeeker {
 public:
  explicit BackgroundAsyncSeeker(Seeker& seeker);
  ~BackgroundAsyncSeeker() override;

  BackgroundAsyncSeeker(const BackgroundAsyncSeeker&) = delete;
  BackgroundAsyncSeeker& operator=(const BackgroundAsyncSeeker&) = delete;

  PollResult<uint64_t> PollSeekSet(const Waker&, uint64_t offset) override;
  PollResult<uint64_t> PollSeekCur(const Waker&, int64_t offset) override;
  PollResult<uint64_t> PollSeekEnd(const Waker&, int64_t offset) override;

 private:
  PollResult<uint64_t> PollRequest(const Waker&, const SeekRequest&);
  void JoinWorker();

  Seeker* seeker_;
  std::thread worker_;

  std::mutex mutex_;
  std::optional<SeekRequest> in_flight_;  // Guarded by mutex_
  PollResult<uint64_t> outcome_;          // Guarded by mutex_
  Waker waker_;                           // Guarded by mutex_
};

}  // namespace seekext
