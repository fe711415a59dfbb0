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

#include "cloudauth/testing_util/status_matchers.h"

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util_internal {

bool StatusIsMatcher::MatchAndExplain(
    Status const& status, ::testing::MatchResultListener* listener) const {
  auto const code_matched = code_matcher_.Matches(status.code());
  auto const message_matched = message_matcher_.Matches(status.message());
  if (listener->IsInterested()) {
    *listener << "with code " << status.code() << " and message \""
              << status.message() << "\"";
  }
  return code_matched && message_matched;
}

void StatusIsMatcher::DescribeTo(std::ostream* os) const {
  *os << "code ";
  code_matcher_.DescribeTo(os);
  *os << " and message ";
  message_matcher_.DescribeTo(os);
}

void StatusIsMatcher::DescribeNegationTo(std::ostream* os) const {
  *os << "code ";
  code_matcher_.DescribeNegationTo(os);
  *os << " or message ";
  message_matcher_.DescribeNegationTo(os);
}

}  // namespace testing_util_internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
