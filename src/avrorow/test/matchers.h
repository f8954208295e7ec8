/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#pragma once

#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "avrorow/result.h"

/*
 * \brief Matchers for Result<T> and Status values.
 *
 *   EXPECT_THAT(result, IsOk());
 *   EXPECT_THAT(result, IsError(ErrorKind::kSchemaMismatch));
 *   EXPECT_THAT(result, HasErrorMessage("required field is missing"));
 *   EXPECT_THAT(result, HasValue(Value::Int(42)));
 */

namespace avrorow {

MATCHER(IsOk, "is an Ok result") {
  if (arg.has_value()) {
    return true;
  }
  *result_listener << "which contains " << ToString(arg.error().kind)
                   << " error: " << arg.error().message;
  return false;
}

MATCHER_P(IsError, kind, "is an Error with the specified kind") {
  if (!arg.has_value()) {
    if (arg.error().kind == kind) {
      return true;
    }
    *result_listener << "which contains error kind " << ToString(arg.error().kind)
                     << " but expected " << ToString(kind)
                     << ", message: " << arg.error().message;
    return false;
  }
  *result_listener << "which is not an error but a value";
  return false;
}

MATCHER_P(HasErrorMessage, message_substr,
          "is an Error with message containing the substring") {
  if (!arg.has_value()) {
    if (arg.error().message.find(message_substr) != std::string::npos) {
      return true;
    }
    *result_listener << "which contains error with message '" << arg.error().message
                     << "' that doesn't contain '" << message_substr << "'";
    return false;
  }
  *result_listener << "which is not an error but a value";
  return false;
}

// Checks that the result holds a value matching the inner matcher.
template <typename MatcherT>
class HasValueMatcher {
 public:
  explicit HasValueMatcher(MatcherT matcher) : matcher_(std::move(matcher)) {}

  template <typename T>
  bool MatchAndExplain(const T& value,
                       ::testing::MatchResultListener* result_listener) const {
    if (!value.has_value()) {
      *result_listener << "which is an error: " << value.error().message;
      return false;
    }
    return ::testing::MatcherCast<const typename T::value_type&>(matcher_)
        .MatchAndExplain(*value, result_listener);
  }

  void DescribeTo(std::ostream* os) const {
    *os << "has a value that ";
    matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "does not have a value that ";
    matcher_.DescribeTo(os);
  }

 private:
  MatcherT matcher_;
};

template <typename MatcherT>
auto HasValue(MatcherT&& matcher) {
  return ::testing::MakePolymorphicMatcher(
      HasValueMatcher<std::decay_t<MatcherT>>(std::forward<MatcherT>(matcher)));
}

inline auto HasValue() { return IsOk(); }

}  // namespace avrorow
