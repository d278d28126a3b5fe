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

#include "seekext/result/error_type.h"

#include <stddef.h>
#include <stdlib.h>

#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace seekext {
namespace {

std::string_view ShortFile(const std::string& file) {
  auto last_slash = file.rfind('/');
  if (last_slash == std::string::npos) {
    return file;
  }
  return std::string_view(file).substr(last_slash + 1);
}

}  // namespace

StackTraceEntry::StackTraceEntry(std::string file, size_t line,
                                 std::string function, std::string expression)
    : file_(std::move(file)),
      line_(line),
      function_(std::move(function)),
      expression_(std::move(expression)) {}

StackTraceEntry::StackTraceEntry(const StackTraceEntry& other)
    : file_(other.file_),
      line_(other.line_),
      function_(other.function_),
      expression_(other.expression_),
      message_(other.message_.str()) {}

StackTraceEntry& StackTraceEntry::operator=(const StackTraceEntry& other) {
  file_ = other.file_;
  line_ = other.line_;
  function_ = other.function_;
  expression_ = other.expression_;
  message_.str(other.message_.str());
  return *this;
}

bool StackTraceEntry::HasMessage() const { return !message_.str().empty(); }

std::string StackTraceError::Message() const {
  std::string message;
  for (const auto& entry : stack_) {
    if (!entry.HasMessage()) {
      continue;
    }
    if (!message.empty()) {
      message += "\n";
    }
    message += entry.Message();
  }
  return message;
}

std::string StackTraceError::Trace() const {
  fmt::memory_buffer out;
  for (auto it = stack_.rbegin(); it != stack_.rend(); it++) {
    if (it != stack_.rbegin()) {
      fmt::format_to(std::back_inserter(out), "\n");
    }
    fmt::format_to(std::back_inserter(out), "{}:{} | {}",
                   ShortFile(it->File()), it->Line(), it->Function());
    if (!it->Expression().empty()) {
      fmt::format_to(std::back_inserter(out), " | {}", it->Expression());
    }
    if (it->HasMessage()) {
      fmt::format_to(std::back_inserter(out), " | {}", it->Message());
    }
  }
  return fmt::to_string(out);
}

std::string StackTraceError::FormatForEnv() const {
  const char* error_format = getenv("SEEKEXT_ERROR_FORMAT");
  if (error_format != nullptr && std::string_view(error_format) == "message") {
    return Message();
  }
  return Trace();
}

std::ostream& operator<<(std::ostream& out, const StackTraceError& error) {
  return out << error.Trace();
}

}  // namespace seekext
