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

#include <string>

#include <gmock/gmock.h>

#include "seekext/result/error_type.h"
#include "seekext/result/result_type.h"

namespace seekext {

// Failing Results are explained with `FormatForEnv()`, so setting
// SEEKEXT_ERROR_FORMAT=message shortens test failure output.

MATCHER(IsOk, negation ? "is a failing Result" : "is an ok Result") {
  if (arg.ok()) {
    return true;
  }
  *result_listener << "which failed with:\n" << arg.error().FormatForEnv();
  return false;
}

MATCHER(IsError, negation ? "is an ok Result" : "is a failing Result") {
  if (!arg.ok()) {
    return true;
  }
  *result_listener << "which is an ok Result";
  return false;
}

MATCHER_P(IsOkAndValue, value_matcher,
          negation ? "is not an ok Result with a matching value"
                   : "is an ok Result with a matching value") {
  if (!arg.ok()) {
    *result_listener << "which failed with:\n" << arg.error().FormatForEnv();
    return false;
  }
  *result_listener << "which holds " << ::testing::PrintToString(*arg) << " ";
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

MATCHER_P(IsErrorAndMessage, message_matcher,
          "is a failing Result with a message that " +
              ::testing::DescribeMatcher<std::string>(message_matcher,
                                                      negation)) {
  if (arg.ok()) {
    *result_listener << "which is an ok Result";
    return false;
  }
  std::string message = arg.error().Message();
  *result_listener << "whose message is \"" << message << "\" ";
  return ::testing::ExplainMatchResult(message_matcher, message,
                                       result_listener);
}

// Matches a failing Result whose error carries exactly `depth` stack entries.
// An error passed back unchanged keeps the depth it was created with.
MATCHER_P(IsErrorWithStackDepth, depth,
          "is a failing Result with " + ::testing::PrintToString(depth) +
              " stack entries") {
  if (arg.ok()) {
    *result_listener << "which is an ok Result";
    return false;
  }
  size_t actual = arg.error().Stack().size();
  if (actual == static_cast<size_t>(depth)) {
    return true;
  }
  *result_listener << "which has " << actual << " entries:\n"
                   << arg.error().Trace();
  return false;
}

}  // namespace seekext
