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

#include "seekext/async/background_seeker.h"

#include <stdint.h>

#include <limits>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <android-base/logging.h>

#include "seekext/async/poll.h"
#include "seekext/io/io.h"
#include "seekext/io/seek_request.h"
#include "seekext/result/expect.h"
#include "seekext/result/result_type.h"

namespace seekext {

BackgroundAsyncSeeker::BackgroundAsyncSeeker(Seeker& seeker)
    : seeker_(&seeker) {}

BackgroundAsyncSeeker::~BackgroundAsyncSeeker() { JoinWorker(); }

PollResult<uint64_t> BackgroundAsyncSeeker::PollSeekSet(const Waker& waker,
                                                        uint64_t offset) {
  if (offset > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    Result<uint64_t> error =
        SX_ERRF("Seek offset {} is out of range for lseek", offset);
    return error;
  }
  return PollRequest(waker, SeekRequest::Set(offset));
}

PollResult<uint64_t> BackgroundAsyncSeeker::PollSeekCur(const Waker& waker,
                                                        int64_t offset) {
  return PollRequest(waker, SeekRequest::Cur(offset));
}

PollResult<uint64_t> BackgroundAsyncSeeker::PollSeekEnd(const Waker& waker,
                                                        int64_t offset) {
  return PollRequest(waker, SeekRequest::End(offset));
}

PollResult<uint64_t> BackgroundAsyncSeeker::PollRequest(
    const Waker& waker, const SeekRequest& request) {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ == request) {
      if (!outcome_) {
        waker_ = waker;
        return std::nullopt;
      }
    } else if (in_flight_) {
      LOG(DEBUG) << "Dropping abandoned " << *in_flight_ << " in favor of "
                 << request;
    }
  }

  // Any worker still attached has either published its outcome or is running
  // an abandoned request. Join outside the lock so that it can finish.
  JoinWorker();

  std::lock_guard lock(mutex_);
  if (in_flight_ == request) {
    PollResult<uint64_t> outcome = std::move(outcome_);
    outcome_.reset();
    in_flight_.reset();
    return outcome;
  }
  in_flight_ = request;
  outcome_.reset();
  waker_ = waker;
  worker_ = std::thread([this, request]() {
    Result<uint64_t> result = Seek(*seeker_, request);
    Waker to_wake;
    {
      std::lock_guard lock(mutex_);
      outcome_ = std::move(result);
      to_wake = waker_;
    }
    to_wake.Wake();
  });
  return std::nullopt;
}

void BackgroundAsyncSeeker::JoinWorker() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

}  // namespace seekext
