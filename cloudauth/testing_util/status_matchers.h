// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CLOUDAUTH_TESTING_UTIL_STATUS_MATCHERS_H
#define CLOUDAUTH_TESTING_UTIL_STATUS_MATCHERS_H

#include "cloudauth/status.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include <gmock/gmock.h>
#include <string>
#include <type_traits>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util_internal {

inline Status const& GetStatus(Status const& status) { return status; }

template <typename T>
Status GetStatus(StatusOr<T> const& value) {
  return value.status();
}

/*
 * Implementation of the StatusIs() matcher for a Status, a StatusOr<T>,
 * or a reference to either of them.
 */
class StatusIsMatcher {
 public:
  template <typename CodeMatcher, typename MessageMatcher>
  StatusIsMatcher(CodeMatcher&& code_matcher, MessageMatcher&& message_matcher)
      : code_matcher_(::testing::MatcherCast<StatusCode>(
            std::forward<CodeMatcher>(code_matcher))),
        message_matcher_(::testing::MatcherCast<std::string const&>(
            std::forward<MessageMatcher>(message_matcher))) {}

  bool MatchAndExplain(Status const& status,
                       ::testing::MatchResultListener* listener) const;

  template <typename T>
  bool MatchAndExplain(StatusOr<T> const& value,
                       ::testing::MatchResultListener* listener) const {
    // StatusOr<T> has no printer, show the status instead of raw bytes.
    auto const status = value.status();
    *listener << "whose status is " << ::testing::PrintToString(status);
    ::testing::StringMatchResultListener inner;
    auto const match = MatchAndExplain(status, &inner);
    if (!inner.str().empty()) *listener << ", " << inner.str();
    return match;
  }

  void DescribeTo(std::ostream* os) const;
  void DescribeNegationTo(std::ostream* os) const;

 private:
  ::testing::Matcher<StatusCode> const code_matcher_;
  ::testing::Matcher<std::string const&> const message_matcher_;
};

template <typename S>
class IsOkAndHoldsMatcherImpl : public ::testing::MatcherInterface<S> {
 public:
  using status_or_type = typename std::remove_cv<
      typename std::remove_reference<S>::type>::type;
  using value_type = typename status_or_type::value_type;

  template <typename ValueMatcher>
  // NOLINTNEXTLINE(bugprone-forwarding-reference-overload)
  explicit IsOkAndHoldsMatcherImpl(ValueMatcher&& value_matcher)
      : value_matcher_(::testing::MatcherCast<value_type const&>(
            std::forward<ValueMatcher>(value_matcher))) {}

  bool MatchAndExplain(
      S value, ::testing::MatchResultListener* listener) const override {
    if (!value) {
      *listener << "whose status is "
                << ::testing::PrintToString(value.status());
      return false;
    }
    return value_matcher_.MatchAndExplain(*value, listener);
  }

  void DescribeTo(std::ostream* os) const override {
    *os << "code is equal to OK and value ";
    value_matcher_.DescribeTo(os);
  }

  void DescribeNegationTo(std::ostream* os) const override {
    *os << "code isn't equal to OK or value ";
    value_matcher_.DescribeNegationTo(os);
  }

 private:
  ::testing::Matcher<value_type const&> const value_matcher_;
};

template <typename ValueMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(ValueMatcher value_matcher)
      : value_matcher_(std::move(value_matcher)) {}

  template <typename S>
  // NOLINTNEXTLINE(google-explicit-constructor)
  operator ::testing::Matcher<S>() const {
    return ::testing::Matcher<S>(
        new IsOkAndHoldsMatcherImpl<S const&>(value_matcher_));
  }

 private:
  ValueMatcher const value_matcher_;
};

}  // namespace testing_util_internal

namespace testing_util {

/**
 * Matches a `Status` or `StatusOr<T>` whose code matches @p code_matcher and
 * whose message matches @p message_matcher.
 *
 * @par Example:
 * @code
 *   EXPECT_THAT(status, StatusIs(StatusCode::kInvalidArgument,
 *                                testing::HasSubstr("not a valid json")));
 * @endcode
 */
template <typename CodeMatcher, typename MessageMatcher>
::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher> StatusIs(
    CodeMatcher&& code_matcher, MessageMatcher&& message_matcher) {
  return ::testing::MakePolymorphicMatcher(
      testing_util_internal::StatusIsMatcher(
          std::forward<CodeMatcher>(code_matcher),
          std::forward<MessageMatcher>(message_matcher)));
}

template <typename CodeMatcher>
::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher> StatusIs(
    CodeMatcher&& code_matcher) {
  return StatusIs(std::forward<CodeMatcher>(code_matcher), ::testing::_);
}

inline ::testing::PolymorphicMatcher<testing_util_internal::StatusIsMatcher>
IsOk() {
  return StatusIs(StatusCode::kOk, ::testing::_);
}

/**
 * Matches a `StatusOr<T>` that holds a value matching @p value_matcher.
 *
 * @par Example:
 * @code
 *   EXPECT_THAT(GetProjectId(client), IsOkAndHolds("test-project"));
 * @endcode
 */
template <typename ValueMatcher>
testing_util_internal::IsOkAndHoldsMatcher<
    typename std::decay<ValueMatcher>::type>
IsOkAndHolds(ValueMatcher&& value_matcher) {
  return testing_util_internal::IsOkAndHoldsMatcher<
      typename std::decay<ValueMatcher>::type>(
      std::forward<ValueMatcher>(value_matcher));
}

/**
 * Matches a `Status` or `StatusOr<T>` whose `ErrorInfo` reason is @p reason.
 *
 * @par Example:
 * @code
 *   EXPECT_THAT(status, ErrorReasonIs("PARSE_ERROR"));
 * @endcode
 */
MATCHER_P(ErrorReasonIs, reason, "has the given ErrorInfo reason") {
  auto const status = testing_util_internal::GetStatus(arg);
  *result_listener << "whose reason is " << status.error_info().reason();
  return status.error_info().reason() == reason;
}

#define EXPECT_STATUS_OK(expression) \
  EXPECT_THAT(expression, ::cloudauth::testing_util::IsOk())
#define ASSERT_STATUS_OK(expression) \
  ASSERT_THAT(expression, ::cloudauth::testing_util::IsOk())

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_TESTING_UTIL_STATUS_MATCHERS_H
