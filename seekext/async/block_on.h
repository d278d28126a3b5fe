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

#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

#include "seekext/async/poll.h"
#include "seekext/result/result_type.h"

namespace seekext {

// Parks a thread until a Waker built by `MakeWaker` is woken.
class WakeSignal : public std::enable_shared_from_this<WakeSignal> {
 public:
  Waker MakeWaker();

  // Returns immediately if woken since the last call.
  void Wait();
  void Notify();

 private:
  std::mutex mutex_;
  std::condition_variable woken_signal_;
  bool woken_ = false;
};

/**
 * Polls `future` on the calling thread until it produces a result, sleeping
 * between polls until the future's AsyncSeeker wakes it.
 *
 * `Future` is any type with `using Output = ...;` and a
 * `PollResult<Output> Poll(const Waker&)` member, such as `StreamLenFuture`.
 */
template <typename Future>
Result<typename Future::Output> BlockOn(Future future) {
  auto signal = std::make_shared<WakeSignal>();
  Waker waker = signal->MakeWaker();
  while (true) {
    PollResult<typename Future::Output> outcome = future.Poll(waker);
    if (outcome) {
      return std::move(*outcome);
    }
    signal->Wait();
  }
}

}  // namespace seekext
