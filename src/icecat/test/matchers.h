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

#include "icecat/result.h"
#include "icecat/util/macros.h"

/*
 * \brief Matchers for Result<T> / Status values
 *
 *   EXPECT_THAT(store->ReplaceReferences(table_id, refs), IsOk());
 *   EXPECT_THAT(result, IsError(ErrorKind::kWarehouseNotActive));
 *   EXPECT_THAT(result, HasErrorMessage("not active"));
 *   EXPECT_THAT(store->LoadReferences(table_id), HasValue(SizeIs(2)));
 */

namespace icecat {

MATCHER(IsOk, "is an Ok result") {
  if (arg.has_value()) {
    return true;
  }
  *result_listener << "which contains error " << ErrorKindToString(arg.error().kind)
                   << ": " << arg.error().message;
  return false;
}

MATCHER_P(IsError, kind, "is an Error with the specified kind") {
  if (arg.has_value()) {
    *result_listener << "which is not an error but a value";
    return false;
  }
  if (arg.error().kind == kind) {
    return true;
  }
  *result_listener << "which contains error kind " << ErrorKindToString(arg.error().kind)
                   << ", message: " << arg.error().message;
  return false;
}

MATCHER_P(HasErrorMessage, message_substr,
          "is an Error with message containing the substring") {
  if (arg.has_value()) {
    *result_listener << "which is not an error but a value";
    return false;
  }
  if (arg.error().message.find(message_substr) != std::string::npos) {
    return true;
  }
  *result_listener << "which contains error with message '" << arg.error().message
                   << "' that doesn't contain '" << message_substr << "'";
  return false;
}

/// Matches a Result holding a value that satisfies the inner matcher.
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

  void DescribeTo(std::ostream* os) const { *os << "has a value matching the matcher"; }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "does not have a value matching the matcher";
  }

 private:
  MatcherT matcher_;
};

template <typename MatcherT>
auto HasValue(MatcherT&& matcher) {
  return ::testing::MakePolymorphicMatcher(
      HasValueMatcher<std::decay_t<MatcherT>>(std::forward<MatcherT>(matcher)));
}

}  // namespace icecat

#define ICECAT_UNWRAP_OR_FAIL_IMPL(result_name, lhs, rexpr)          \
  auto&& result_name = (rexpr);                                      \
  ASSERT_TRUE(result_name.has_value()) << result_name.error().message; \
  lhs = std::move(result_name.value());

/// Assign the value of a Result to `lhs`, or fail the current test.
#define ICECAT_UNWRAP_OR_FAIL(lhs, rexpr) \
  ICECAT_UNWRAP_OR_FAIL_IMPL(ICECAT_ASSIGN_OR_RAISE_NAME(unwrap_, __COUNTER__), lhs, rexpr)
