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

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/expected.h>

namespace seekext {

class StackTraceError;

/**
 * One frame of a failure: where the error was created or passed through, and
 * the optional message attached at that point.
 */
class StackTraceEntry {
 public:
  StackTraceEntry(std::string file, size_t line, std::string function,
                  std::string expression);

  StackTraceEntry(const StackTraceEntry& other);
  StackTraceEntry(StackTraceEntry&&) = default;
  StackTraceEntry& operator=(const StackTraceEntry& other);
  StackTraceEntry& operator=(StackTraceEntry&&) = default;

  template <typename T>
  StackTraceEntry& operator<<(T&& message_ext) & {
    message_ << std::forward<T>(message_ext);
    return *this;
  }
  template <typename T>
  StackTraceEntry operator<<(T&& message_ext) && {
    message_ << std::forward<T>(message_ext);
    return std::move(*this);
  }

  operator StackTraceError() &&;
  template <typename T>
  operator android::base::expected<T, StackTraceError>() &&;

  bool HasMessage() const;
  std::string Message() const { return message_.str(); }

  const std::string& File() const { return file_; }
  size_t Line() const { return line_; }
  const std::string& Function() const { return function_; }
  const std::string& Expression() const { return expression_; }

 private:
  std::string file_;
  size_t line_;
  std::string function_;
  std::string expression_;
  std::stringstream message_;
};

#define SX_STACK_TRACE_ENTRY(expression) \
  StackTraceEntry(__FILE__, __LINE__, __func__, expression)

class StackTraceError {
 public:
  StackTraceError& PushEntry(StackTraceEntry entry) & {
    stack_.emplace_back(std::move(entry));
    return *this;
  }
  StackTraceError PushEntry(StackTraceEntry entry) && {
    stack_.emplace_back(std::move(entry));
    return std::move(*this);
  }
  const std::vector<StackTraceEntry>& Stack() const { return stack_; }

  // Messages of every entry, innermost first, without locations.
  std::string Message() const;

  // One line per entry, outermost first, with file, line and function.
  std::string Trace() const;

  // Message() or Trace() depending on the SEEKEXT_ERROR_FORMAT environment
  // variable ("message" or "trace", defaulting to "trace").
  std::string FormatForEnv() const;

  template <typename T>
  operator android::base::expected<T, StackTraceError>() && {
    return android::base::unexpected(std::move(*this));
  }

 private:
  std::vector<StackTraceEntry> stack_;
};

inline StackTraceEntry::operator StackTraceError() && {
  return StackTraceError().PushEntry(std::move(*this));
}

template <typename T>
inline StackTraceEntry::operator android::base::expected<T,
                                                         StackTraceError>() && {
  return android::base::unexpected(StackTraceError(std::move(*this)));
}

std::ostream& operator<<(std::ostream&, const StackTraceError&);

}  // namespace seekext
