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

#include <string.h>

#include <fmt/core.h>  // IWYU pragma: export

#include "seekext/result/error_type.h"
#include "seekext/result/result_type.h"  // IWYU pragma: export

namespace seekext {

/**
 * Error constructors. Each creates a single `StackTraceEntry` recording the
 * file, line and function of the call site, which converts to a failing
 * `Result<T>` for any `T`.
 *
 * - `SX_ERR(MSG)` streams `MSG` into the entry with `operator<<`.
 * - `SX_ERRF(FORMAT, ...)` formats the message with fmt, checked at compile
 *   time.
 * - `SX_ERRNO(ERR, MSG)` appends the description of the errno value `ERR`.
 *   Save `errno` right after the failing call and pass the saved value, since
 *   building the message may clobber `errno`.
 *
 * Example usage:
 *
 *     off_t pos = lseek(fd, 0, SEEK_END);
 *     if (pos < 0) {
 *       int error_num = errno;
 *       return SX_ERRNO(error_num, "lseek(" << fd << ", 0, SEEK_END) failed");
 *     }
 *
 * which fails with the message
 *
 *     lseek(3, 0, SEEK_END) failed: Illegal seek
 */
#define SX_ERR(MSG) (SX_STACK_TRACE_ENTRY("") << MSG)
#define SX_ERRF(MSG, ...) \
  (SX_STACK_TRACE_ENTRY("") << fmt::format(FMT_STRING(MSG), __VA_ARGS__))
#define SX_ERRNO(ERR, MSG) \
  (SX_STACK_TRACE_ENTRY("") << MSG << ": " << strerror(ERR))

/**
 * Returns from the enclosing function with a failing Result unless
 * `LHS <= RHS`. The error records the compared expression, both values and
 * `MSG`. Usable only in functions that return a Result.
 *
 *     SX_EXPECT_LE(offset, kMaxOffset, "Offset out of range");
 */
#define SX_EXPECT_LE(LHS, RHS, MSG)                                      \
  do {                                                                   \
    auto&& sx_expect_lhs = (LHS);                                        \
    auto&& sx_expect_rhs = (RHS);                                        \
    if (!(sx_expect_lhs <= sx_expect_rhs)) {                             \
      return SX_STACK_TRACE_ENTRY(#LHS " <= " #RHS)                      \
             << "Expected " << sx_expect_lhs << " <= " << sx_expect_rhs \
             << ". " << MSG;                                             \
    }                                                                    \
  } while (false)

}  // namespace seekext
