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

#include "seekext/async/block_on.h"

#include <memory>
#include <mutex>

#include <android-base/logging.h>

#include "seekext/async/poll.h"

namespace seekext {

Waker WakeSignal::MakeWaker() {
  // A waker copied into an AsyncSeeker may outlive the BlockOn call.
  std::weak_ptr<WakeSignal> weak_signal = weak_from_this();
  return Waker([weak_signal]() {
    if (auto signal = weak_signal.lock()) {
      signal->Notify();
    }
  });
}

void WakeSignal::Wait() {
  std::unique_lock lock(mutex_);
  if (!woken_) {
    LOG(VERBOSE) << "Parking until woken";
  }
  woken_signal_.wait(lock, [this]() { return woken_; });
  woken_ = false;
}

void WakeSignal::Notify() {
  {
    std::lock_guard lock(mutex_);
    woken_ = true;
  }
  woken_signal_.notify_one();
}

}  // namespace seekext
