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

#ifndef CLOUDAUTH_TESTING_UTIL_MOCK_HTTP_PAYLOAD_H
#define CLOUDAUTH_TESTING_UTIL_MOCK_HTTP_PAYLOAD_H

#include "cloudauth/internal/http_payload.h"
#include "cloudauth/version.h"
#include "absl/memory/memory.h"
#include <gmock/gmock.h>
#include <algorithm>
#include <memory>
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

class MockHttpPayload : public rest_internal::HttpPayload {
 public:
  ~MockHttpPayload() override = default;
  MOCK_METHOD(StatusOr<std::size_t>, Read, (absl::Span<char> buffer),
              (override));
};

/**
 * Returns a payload that yields @p contents, in as many `Read()` calls as the
 * caller's buffer size requires.
 */
inline std::unique_ptr<rest_internal::HttpPayload> MakeMockHttpPayloadSuccess(
    std::string contents) {
  auto mock = absl::make_unique<MockHttpPayload>();
  auto remaining = std::make_shared<std::string>(std::move(contents));
  EXPECT_CALL(*mock, Read).WillRepeatedly([remaining](absl::Span<char> buffer) {
    auto const n = (std::min)(buffer.size(), remaining->size());
    std::copy(remaining->begin(), remaining->begin() + n, buffer.begin());
    remaining->erase(0, n);
    return StatusOr<std::size_t>(n);
  });
  return mock;
}

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_TESTING_UTIL_MOCK_HTTP_PAYLOAD_H
