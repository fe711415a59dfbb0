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

#include "cloudauth/oauth2/service_account_credentials.h"
#include "cloudauth/oauth2/errors.h"
#include "cloudauth/oauth2/jwt.h"
#include "cloudauth/oauth2/oauth2_client.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/testing_util/mock_rest_client.h"
#include "cloudauth/testing_util/status_matchers.h"
#include "cloudauth/testing_util/test_keys.h"
#include <gmock/gmock.h>
#include <chrono>
#include <cstdio>
#include <fstream>

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
using ::cloudauth::testing_util::TestCertificate;
using ::cloudauth::testing_util::TestServiceAccountInfo;
using ::testing::_;
using ::testing::A;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Pair;

using FormData = std::vector<std::pair<std::string, std::string>>;

auto constexpr kEmail = "test-sa@test-project.iam.gserviceaccount.com";
auto constexpr kTokenUri = "https://oauth2.googleapis.com/token";
auto constexpr kNowSeconds = 1500000000;

std::chrono::system_clock::time_point FixedNow() {
  return std::chrono::system_clock::from_time_t(kNowSeconds);
}

std::string FindAssertion(FormData const& form) {
  for (auto const& kv : form) {
    if (kv.first == "assertion") return kv.second;
  }
  return {};
}

StatusOr<nlohmann::json> DecodeAssertion(std::string const& assertion) {
  JwtDecodeOptions options;
  options.certs = TestCertificate();
  options.audience = kTokenUri;
  options.now = FixedNow();
  return JwtDecode(assertion, options);
}

std::shared_ptr<ServiceAccountCredentials> MakeCredentials(
    absl::optional<std::vector<std::string>> scopes =
        std::vector<std::string>{"scope1", "scope2"},
    absl::optional<std::string> subject = {}) {
  auto credentials = ServiceAccountCredentials::FromServiceAccountInfo(
      TestServiceAccountInfo(), std::move(scopes), std::move(subject), {},
      FixedNow);
  EXPECT_STATUS_OK(credentials);
  return *credentials;
}

TEST(ServiceAccountCredentials, FromServiceAccountInfo) {
  auto credentials = MakeCredentials();
  EXPECT_EQ(credentials->service_account_email(), kEmail);
  EXPECT_EQ(credentials->signer_email(), kEmail);
  EXPECT_EQ(credentials->token_uri(), kTokenUri);
  EXPECT_FALSE(credentials->subject().has_value());
  EXPECT_TRUE(credentials->HasScopes("scope1 scope2"));
  EXPECT_FALSE(credentials->requires_scopes());
}

TEST(ServiceAccountCredentials, DefaultTokenUri) {
  auto info = TestServiceAccountInfo();
  info.erase("token_uri");
  auto credentials = ServiceAccountCredentials::FromServiceAccountInfo(info);
  ASSERT_STATUS_OK(credentials);
  EXPECT_EQ((*credentials)->token_uri(), kGoogleOAuthTokenUri);
}

TEST(ServiceAccountCredentials, FromServiceAccountFileErrors) {
  auto const path = ::testing::TempDir() + "sa-credentials-invalid.json";
  std::ofstream(path) << "{ this is not json";
  auto credentials = ServiceAccountCredentials::FromServiceAccountFile(path);
  EXPECT_THAT(credentials, StatusIs(StatusCode::kInvalidArgument,
                                    "File " + path +
                                        " is not a valid json file."));
  (void)std::remove(path.c_str());

  credentials = ServiceAccountCredentials::FromServiceAccountFile(path);
  EXPECT_THAT(credentials,
              StatusIs(StatusCode::kInvalidArgument,
                       "Cannot open credentials file " + path));
}

TEST(ServiceAccountCredentials, RequiresScopes) {
  EXPECT_TRUE(MakeCredentials(absl::nullopt)->requires_scopes());
  EXPECT_TRUE(MakeCredentials(std::vector<std::string>{})->requires_scopes());

  auto credentials = MakeCredentials(absl::nullopt);
  auto scoped = credentials->WithScopes({"scope3"});
  ASSERT_STATUS_OK(scoped);
  auto const* s = dynamic_cast<Scoped const*>(scoped->get());
  ASSERT_NE(s, nullptr);
  EXPECT_FALSE(s->requires_scopes());
  EXPECT_TRUE(s->HasScopes("scope3"));
  EXPECT_TRUE(credentials->requires_scopes());
}

/// @test Verify the assertion and the grant request.
TEST(ServiceAccountCredentials, Refresh) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const& request,
                   FormData const& form) {
        EXPECT_EQ(request.path(), kTokenUri);
        EXPECT_THAT(form, Contains(Pair("grant_type", kJwtGrantType)));
        auto payload = DecodeAssertion(FindAssertion(form));
        EXPECT_STATUS_OK(payload);
        if (payload) {
          auto const expected = nlohmann::json{
              {"iss", kEmail},           {"aud", kTokenUri},
              {"iat", kNowSeconds},      {"exp", kNowSeconds + 3600},
              {"scope", "scope1 scope2"},
          };
          EXPECT_EQ(*payload, expected);
        }
        auto header = JwtDecodeHeader(FindAssertion(form));
        EXPECT_STATUS_OK(header);
        if (header) {
          EXPECT_EQ(header->value("kid", ""), "test-key-id");
        }
        return MakeMockJsonResponse(
            200, R"js({"access_token": "at", "expires_in": 3600,
                       "token_type": "Bearer"})js");
      });

  auto credentials = MakeCredentials();
  ASSERT_STATUS_OK(credentials->Refresh(client));
  EXPECT_EQ(credentials->token(), "at");
  EXPECT_EQ(credentials->expiry(), FixedNow() + std::chrono::seconds(3600));
}

TEST(ServiceAccountCredentials, RefreshWithSubject) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const&, FormData const& form) {
        auto payload = DecodeAssertion(FindAssertion(form));
        EXPECT_STATUS_OK(payload);
        if (payload) {
          EXPECT_EQ(payload->value("sub", ""), "user@example.com");
        }
        return MakeMockJsonResponse(200, R"js({"access_token": "at"})js");
      });
  auto credentials = MakeCredentials()->WithSubject("user@example.com");
  EXPECT_EQ(credentials->subject(), "user@example.com");
  ASSERT_STATUS_OK(credentials->Refresh(client));
}

TEST(ServiceAccountCredentials, RefreshError) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const&, FormData const&) {
        return MakeMockJsonResponse(
            400, R"js({"error": "invalid_scope",
                       "error_description": "Invalid OAuth scope."})js");
      });
  auto credentials = MakeCredentials();
  auto status = credentials->Refresh(client);
  EXPECT_THAT(status, StatusIs(StatusCode::kUnauthenticated,
                               "invalid_scope: Invalid OAuth scope."));
  EXPECT_TRUE(IsRefreshError(status));
  EXPECT_FALSE(credentials->token().has_value());
}

TEST(ServiceAccountCredentials, BeforeRequest) {
  MockRestClient client;
  EXPECT_CALL(client, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const&, FormData const&) {
        return MakeMockJsonResponse(
            200, R"js({"access_token": "at", "expires_in": 3600})js");
      });
  auto credentials = MakeCredentials();
  HttpHeaders headers;
  ASSERT_STATUS_OK(
      credentials->BeforeRequest(client, "GET", "https://a/b", headers));
  ASSERT_STATUS_OK(
      credentials->BeforeRequest(client, "GET", "https://a/b", headers));
  EXPECT_THAT(headers["authorization"], ElementsAre("Bearer at"));
}

TEST(ServiceAccountCredentials, SignBytes) {
  auto credentials = MakeCredentials();
  auto signature = credentials->SignBytes("payload");
  ASSERT_STATUS_OK(signature);
  EXPECT_TRUE(VerifySignature("payload", *signature, TestCertificate()));
}

}  // namespace
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
