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

#include "seekext/io/seek_request.h"

#include <stdint.h>

#include <ostream>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

#include "seekext/io/io.h"
#include "seekext/result/expect.h"
#include "seekext/result/result_type.h"

namespace seekext {

bool operator==(const SeekRequest& lhs, const SeekRequest& rhs) {
  return lhs.whence == rhs.whence && lhs.offset == rhs.offset;
}

bool operator!=(const SeekRequest& lhs, const SeekRequest& rhs) {
  return !(lhs == rhs);
}

std::string_view WhenceName(Whence whence) {
  switch (whence) {
    case Whence::kSet:
      return "SEEK_SET";
    case Whence::kCur:
      return "SEEK_CUR";
    case Whence::kEnd:
      return "SEEK_END";
  }
  return "SEEK_UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, Whence whence) {
  return out << WhenceName(whence);
}

std::ostream& operator<<(std::ostream& out, const SeekRequest& request) {
  return out << fmt::format("{}", request);
}

Result<uint64_t> Seek(Seeker& seeker, const SeekRequest& request) {
  switch (request.whence) {
    case Whence::kSet:
      return seeker.SeekSet(static_cast<uint64_t>(request.offset));
    case Whence::kCur:
      return seeker.SeekCur(request.offset);
    case Whence::kEnd:
      return seeker.SeekEnd(request.offset);
  }
  return SX_ERRF("Unknown whence value {}", static_cast<int>(request.whence));
}

}  // namespace seekext

fmt::format_context::iterator fmt::formatter<seekext::SeekRequest>::format(
    const seekext::SeekRequest& request, format_context& ctx) const {
  std::string text = fmt::format("lseek({}, {})", request.offset,
                                 seekext::WhenceName(request.whence));
  return fmt::formatter<std::string_view>::format(text, ctx);
}
