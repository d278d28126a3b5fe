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

#include <ostream>
#include <string_view>

#include <fmt/core.h>

#include "seekext/io/io.h"
#include "seekext/result/result_type.h"

namespace seekext {

enum class Whence {
  kSet,
  kCur,
  kEnd,
};

// A single seek request, as it would be passed to lseek(2). For kSet the
// offset is never negative.
struct SeekRequest {
  Whence whence;
  int64_t offset;

  static SeekRequest Set(uint64_t offset) {
    return SeekRequest{Whence::kSet, static_cast<int64_t>(offset)};
  }
  static SeekRequest Cur(int64_t offset) {
    return SeekRequest{Whence::kCur, offset};
  }
  static SeekRequest End(int64_t offset) {
    return SeekRequest{Whence::kEnd, offset};
  }
};

bool operator==(const SeekRequest&, const SeekRequest&);
bool operator!=(const SeekRequest&, const SeekRequest&);

std::string_view WhenceName(Whence);

std::ostream& operator<<(std::ostream&, Whence);
std::ostream& operator<<(std::ostream&, const SeekRequest&);

// Issues `request` on `seeker` through the matching Seek* member.
Result<uint64_t> Seek(Seeker& seeker, const SeekRequest& request);

}  // namespace seekext

template <>
struct fmt::formatter<seekext::SeekRequest>
    : fmt::formatter<std::string_view> {
  format_context::iterator format(const seekext::SeekRequest& request,
                                  format_context& ctx) const;
};
