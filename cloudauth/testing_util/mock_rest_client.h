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

#ifndef CLOUDAUTH_TESTING_UTIL_MOCK_REST_CLIENT_H
#define CLOUDAUTH_TESTING_UTIL_MOCK_REST_CLIENT_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/internal/rest_response.h"
#include "cloudauth/testing_util/mock_http_payload.h"
#include "cloudauth/version.h"
#include "absl/memory/memory.h"
#include <gmock/gmock.h>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace testing_util {

class MockRestClient : public rest_internal::RestClient {
 public:
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Delete,
              (rest_internal::RestContext&, rest_internal::RestRequest const&),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Get,
              (rest_internal::RestContext&, rest_internal::RestRequest const&),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Patch,
              (rest_internal::RestContext&, rest_internal::RestRequest const&,
               std::vector<absl::Span<char const>> const&),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Post,
              (rest_internal::RestContext&, rest_internal::RestRequest const&,
               std::vector<absl::Span<char const>> const&),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Post,
              (rest_internal::RestContext&, rest_internal::RestRequest const&,
               (std::vector<std::pair<std::string, std::string>> const&)),
              (override));
  MOCK_METHOD(StatusOr<std::unique_ptr<rest_internal::RestResponse>>, Put,
              (rest_internal::RestContext&, rest_internal::RestRequest const&,
               std::vector<absl::Span<char const>> const&),
              (override));
};

class MockRestResponse : public rest_internal::RestResponse {
 public:
  ~MockRestResponse() override = default;
  MOCK_METHOD(rest_internal::HttpStatusCode, StatusCode, (), (const, override));
  MOCK_METHOD((std::multimap<std::string, std::string>), Headers, (),
              (const, override));
  MOCK_METHOD(std::unique_ptr<rest_internal::HttpPayload>, ExtractPayload, (),
              (ref(&&), override));
};

/**
 * Returns a response with the given status, body and headers.
 *
 * The payload can be extracted at most once. Header names should be
 * lowercase, as `CurlRestClient` returns them.
 */
inline std::unique_ptr<rest_internal::RestResponse> MakeMockResponse(
    int status_code, std::string body,
    std::multimap<std::string, std::string> headers = {}) {
  auto response = absl::make_unique<MockRestResponse>();
  EXPECT_CALL(*response, StatusCode)
      .WillRepeatedly(::testing::Return(
          static_cast<rest_internal::HttpStatusCode>(status_code)));
  EXPECT_CALL(*response, Headers)
      .WillRepeatedly(::testing::Return(std::move(headers)));
  EXPECT_CALL(std::move(*response), ExtractPayload)
      .Times(::testing::AtMost(1))
      .WillOnce([body = std::move(body)]() mutable {
        return MakeMockHttpPayloadSuccess(std::move(body));
      });
  return response;
}

/// A response with a JSON body and an `application/json` content type.
inline std::unique_ptr<rest_internal::RestResponse> MakeMockJsonResponse(
    int status_code, std::string body) {
  return MakeMockResponse(status_code, std::move(body),
                          {{"content-type", "application/json"}});
}

}  // namespace testing_util
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_TESTING_UTIL_MOCK_REST_CLIENT_H
