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

#include <functional>
#include <optional>
#include <utility>

#include "seekext/result/result_type.h"

namespace seekext {

/**
 * Handle passed down with every poll. An operation that cannot complete yet
 * keeps a copy and calls `Wake()` once the poller should try again.
 */
class Waker {
 public:
  Waker() = default;
  explicit Waker(std::function<void()> wake) : wake_(std::move(wake)) {}

  // Does nothing on a default constructed waker.
  void Wake() const {
    if (wake_) {
      wake_();
    }
  }

 private:
  std::function<void()> wake_;
};

/**
 * Outcome of polling an operation once. `std::nullopt` means the operation is
 * still pending; otherwise it holds the final result.
 */
template <typename T>
using PollResult = std::optional<Result<T>>;

}  // namespace seekext
