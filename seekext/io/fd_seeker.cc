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

#include "seekext/io/fd_seeker.h"

#include <errno.h>
#include <stdint.h>
#include <sys/types.h>
#include <unistd.h>

#include <limits>
#include <utility>

#include <android-base/unique_fd.h>

#include "seekext/result/expect.h"
#include "seekext/result/result_type.h"

namespace seekext {

FdSeeker::FdSeeker(android::base::unique_fd fd) : fd_(std::move(fd)) {}

Result<uint64_t> FdSeeker::SeekSet(uint64_t offset) {
  SX_EXPECT_LE(offset,
               static_cast<uint64_t>(std::numeric_limits<off_t>::max()),
               "Offset does not fit in off_t");
  off_t new_offset = lseek(fd_.get(), static_cast<off_t>(offset), SEEK_SET);
  if (new_offset < 0) {
    int error_num = errno;
    return SX_ERRNO(error_num, "lseek(" << fd_.get() << ", " << offset
                                        << ", SEEK_SET) failed");
  }
  return static_cast<uint64_t>(new_offset);
}

Result<uint64_t> FdSeeker::SeekCur(int64_t offset) {
  off_t new_offset = lseek(fd_.get(), static_cast<off_t>(offset), SEEK_CUR);
  if (new_offset < 0) {
    int error_num = errno;
    return SX_ERRNO(error_num, "lseek(" << fd_.get() << ", " << offset
                                        << ", SEEK_CUR) failed");
  }
  return static_cast<uint64_t>(new_offset);
}

Result<uint64_t> FdSeeker::SeekEnd(int64_t offset) {
  off_t new_offset = lseek(fd_.get(), static_cast<off_t>(offset), SEEK_END);
  if (new_offset < 0) {
    int error_num = errno;
    return SX_ERRNO(error_num, "lseek(" << fd_.get() << ", " << offset
                                        << ", SEEK_END) failed");
  }
  return static_cast<uint64_t>(new_offset);
}

}  // namespace seekext
