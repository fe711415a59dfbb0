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

#include "cloudauth/oauth2/user_credentials.h"
#include "cloudauth/oauth2/errors.h"
#include "cloudauth/testing_util/mock_rest_client.h"
#include "cloudauth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <chrono>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::cloudauth::rest_internal::HttpHeaders;
using ::cloudauth::rest_internal::RestContext;
using ::cloudauth::rest_internal::RestRequest;
using ::cloudauth::testing_util::MakeMockJsonResponse;
using ::cloudauth::testing_util::MockRestClient;
using ::cloudauth::testing_util::StatusIs;
using ::testing::_;
using ::testing::A;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

using FormData = std::vector<std::pair<std::string, std::string>>;

auto constexpr kNowSeconds = 1500000000;

std::chrono::system_clock::time_point FixedNow() {
  return std::chrono::system_clock::from_time_t(kNowSeconds);
}

UserCredentialsInfo TestInfo() {
  UserCredentialsInfo info;
  info.refresh_token = "rt";
  info.token_uri = "https://oauth2.googleapis.com/token";
  info.client_id = "cid";
  info.client_secret = "secret";
  return info;
}

TEST(UserCredentials, ParseAuthorizedUserInfo) {
  auto const json = nlohmann::json{{"type", "authorized_user"},
                                   {"refresh_token", "rt"},
                                   {"client_id", "cid"},
                                   {"client_secret", "secret"}};
  auto info = ParseAuthorizedUserInfo(json, "test");
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->refresh_token, "rt");
  EXPECT_EQ(info->client_id, "cid");
  EXPECT_EQ(info->client_secret, "secret");
  EXPECT_EQ(info->token_uri, kGoogleOAuthTokenUri);
  EXPECT_FALSE(info->token.has_value());

  info = ParseAuthorizedUserInfo(json, "test", "https://custom/token");
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->token_uri, "https://custom/token");
}

TEST(UserCredentials, ParseAuthorizedUserInfoMissingFields) {
  for (auto const* field : {"refresh_token", "client_id", "client_secret"}) {
    auto json = nlohmann::json{{"refresh_token", "rt"},
                               {"client_id", "cid"},
                               {"client_secret", "secret"}};
    json.erase(field);
    auto info = ParseAuthorizedUserInfo(json, "test-source");
    EXPECT_THAT(info, StatusIs(StatusCode::kInvalidArgument,
                               AllOf(HasSubstr(field),
                                     HasSubstr("test-source"))));
    EXPECT_TRUE(IsParseError(info.status()));
  }
}

TEST(UserCredentials, InitialTokenNeverExpires) {
  auto info = TestInfo();
  info.token = "initial";
  UserCredentials credentials(info, FixedNow);
  EXPECT_EQ(credentials.token(), "initial");
  EXPECT_FALSE(credentials.expiry().has_value());
  EXPECT_TRUE(credentials.valid());
}

TEST(UserCredentials, Refresh) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const& request,
                   FormData const& form) {
        EXPECT_EQ(request.path(), "https://oauth2.googleapis.com/token");
        EXPECT_THAT(form, Contains(Pair("refresh_token", "rt")));
        EXPECT_THAT(form, Contains(Pair("grant_type", "refresh_token")));
        return MakeMockJsonResponse(
            200, R"js({"access_token": "at1", "expires_in": 3600,
                       "refresh_token": "rt2"})js");
      })
      .WillOnce([](RestContext&, RestRequest const&, FormData const& form) {
        EXPECT_THAT(form, Contains(Pair("refresh_token", "rt2")));
        return MakeMockJsonResponse(200, R"js({"access_token": "at2"})js");
      });

  UserCredentials credentials(TestInfo(), FixedNow);
  ASSERT_STATUS_OK(credentials.Refresh(client));
  EXPECT_EQ(credentials.token(), "at1");
  EXPECT_EQ(credentials.expiry(), FixedNow() + std::chrono::seconds(3600));
  EXPECT_EQ(credentials.refresh_token(), "rt2");

  ASSERT_STATUS_OK(credentials.Refresh(client));
  EXPECT_EQ(credentials.token(), "at2");
  EXPECT_EQ(credentials.refresh_token(), "rt2");
}

TEST(UserCredentials, RefreshMissingFields) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>())).Times(0);
  auto info = TestInfo();
  info.client_secret.clear();
  UserCredentials credentials(info, FixedNow);
  auto status = credentials.Refresh(client);
  EXPECT_THAT(status, StatusIs(StatusCode::kUnauthenticated,
                               HasSubstr("You must specify refresh_token")));
  EXPECT_TRUE(IsRefreshError(status));
}

TEST(UserCredentials, RefreshErrorKeepsState) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const&, FormData const&) {
        return MakeMockJsonResponse(
            400, R"js({"error": "invalid_grant",
                       "error_description": "Bad Request"})js");
      });
  auto info = TestInfo();
  info.token = "initial";
  UserCredentials credentials(info, FixedNow);
  auto status = credentials.Refresh(client);
  EXPECT_THAT(status, StatusIs(StatusCode::kUnauthenticated,
                               "invalid_grant: Bad Request"));
  EXPECT_EQ(credentials.token(), "initial");
  EXPECT_EQ(credentials.refresh_token(), "rt");
}

TEST(UserCredentials, BeforeRequest) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const&, FormData const&) {
        return MakeMockJsonResponse(
            200, R"js({"access_token": "at", "expires_in": 3600})js");
      });
  UserCredentials credentials(TestInfo(), FixedNow);
  HttpHeaders headers;
  ASSERT_STATUS_OK(
      credentials.BeforeRequest(client, "GET", "https://a/b", headers));
  ASSERT_STATUS_OK(
      credentials.BeforeRequest(client, "GET", "https://a/b", headers));
  EXPECT_THAT(headers["authorization"], ElementsAre("Bearer at"));
}

TEST(UserCredentials, Scopes) {
  auto info = TestInfo();
  info.scopes = std::vector<std::string>{"email", "profile"};
  UserCredentials credentials(info, FixedNow);
  EXPECT_FALSE(credentials.requires_scopes());
  EXPECT_TRUE(credentials.HasScopes("email profile"));
  auto copy = credentials.WithScopes({"other"});
  EXPECT_THAT(copy, StatusIs(StatusCode::kUnimplemented,
                             "OAuth 2.0 Credentials can not modify their "
                             "scopes."));
  EXPECT_TRUE(IsUnsupportedOperationError(copy.status()));
}

}  // namespace
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
