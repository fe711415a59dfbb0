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

#include "cloudauth/oauth2/authorized_http_client.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/testing_util/mock_rest_client.h"
#include "cloudauth/testing_util/scoped_log.h"
#include "cloudauth/testing_util/status_matchers.h"
#include <gmock/gmock.h>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::cloudauth::rest_internal::HttpHeaders;
using ::cloudauth::rest_internal::RestContext;
using ::cloudauth::rest_internal::RestRequest;
using ::cloudauth::rest_internal::RestResponse;
using ::cloudauth::testing_util::MakeMockResponse;
using ::cloudauth::testing_util::MockRestClient;
using ::cloudauth::testing_util::ScopedLog;
using ::cloudauth::testing_util::StatusIs;
using ::testing::_;
using ::testing::A;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Pair;

using FormData = std::vector<std::pair<std::string, std::string>>;
using Payload = std::vector<absl::Span<char const>>;

/// Issues `token-<n>` on the n-th refresh, tokens never expire.
class CountingCredentials : public Credentials {
 public:
  Status Refresh(rest_internal::RestClient& client) override {
    refresh_clients.push_back(&client);
    if (!next_status.ok()) return next_status;
    SetToken("token-" + std::to_string(refresh_clients.size()),
             absl::nullopt);
    return Status{};
  }

  std::vector<rest_internal::RestClient*> refresh_clients;
  Status next_status;
};

std::string Authorization(RestRequest const& request) {
  auto values = request.GetHeader("authorization");
  return values.empty() ? std::string{} : values.front();
}

class AuthorizedHttpClientTest : public ::testing::Test {
 protected:
  std::shared_ptr<CountingCredentials> credentials_ =
      std::make_shared<CountingCredentials>();
  std::shared_ptr<MockRestClient> mock_ = std::make_shared<MockRestClient>();
};

TEST_F(AuthorizedHttpClientTest, AddsAuthorizationHeader) {
  EXPECT_CALL(*mock_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(request.path(), "https://example.com/v1/items");
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        EXPECT_THAT(request.GetHeader("x-custom"), ElementsAre("value"));
        EXPECT_THAT(request.parameters(), ElementsAre(Pair("page", "2")));
        return MakeMockResponse(200, "ok");
      })
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        return MakeMockResponse(200, "ok");
      });

  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto const request = RestRequest("https://example.com/v1/items")
                           .AddHeader("x-custom", "value")
                           .AddQueryParameter("page", "2");
  auto response = client.Get(context, request);
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 200);
  response = client.Get(context, request);
  ASSERT_STATUS_OK(response);

  EXPECT_EQ(credentials_->refresh_clients.size(), 1U);
  // The caller's request is not modified.
  EXPECT_THAT(request.GetHeader("authorization"), IsEmpty());
}

/// @test A 401 refreshes the credentials and retries the request.
TEST_F(AuthorizedHttpClientTest, RefreshOnUnauthorized) {
  ScopedLog log;
  EXPECT_CALL(*mock_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        return MakeMockResponse(401, "expired");
      })
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(Authorization(request), "Bearer token-2");
        return MakeMockResponse(200, "ok");
      });

  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto response = client.Get(context, RestRequest("https://example.com/"));
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 200);
  EXPECT_EQ(credentials_->refresh_clients.size(), 2U);
  EXPECT_THAT(log.ExtractLines(),
              Contains(HasSubstr("Refreshing credentials due to a 401 "
                                 "response. Attempt 1/2.")));
}

/// @test The retry starts from the caller's headers, not the previous attempt.
TEST_F(AuthorizedHttpClientTest, RetryUsesOriginalHeaders) {
  EXPECT_CALL(*mock_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_THAT(request.GetHeader("x-custom"), ElementsAre("v"));
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-1"));
        return MakeMockResponse(401, "expired");
      })
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_THAT(request.GetHeader("x-custom"), ElementsAre("v"));
        EXPECT_THAT(request.GetHeader("authorization"),
                    ElementsAre("Bearer token-2"));
        return MakeMockResponse(200, "ok");
      });

  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto const request = RestRequest("https://example.com/")
                           .AddHeader("x-custom", "v")
                           .AddHeader("authorization", "stale");
  auto const original = request;
  auto response = client.Get(context, request);
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 200);
  EXPECT_EQ(request, original);
  EXPECT_THAT(request.GetHeader("authorization"), ElementsAre("stale"));
}

/// @test After the maximum attempts the last response is returned.
TEST_F(AuthorizedHttpClientTest, RefreshAttemptsExhausted) {
  EXPECT_CALL(*mock_, Get)
      .Times(3)
      .WillRepeatedly([](RestContext&, RestRequest const&) {
        return MakeMockResponse(401, "denied");
      });

  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto response = client.Get(context, RestRequest("https://example.com/"));
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 401);
  // One refresh before the first request, and one per retry.
  EXPECT_EQ(credentials_->refresh_clients.size(), 3U);
}

TEST_F(AuthorizedHttpClientTest, RefreshOptions) {
  EXPECT_CALL(*mock_, Delete)
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(403, "forbidden");
      })
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(403, "forbidden");
      });

  AuthorizedHttpClient client(
      credentials_, mock_,
      Options{}
          .set<RefreshStatusCodesOption>({401, 403})
          .set<MaxRefreshAttemptsOption>(1));
  RestContext context;
  auto response = client.Delete(context, RestRequest("https://example.com/"));
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 403);
  EXPECT_EQ(credentials_->refresh_clients.size(), 2U);
}

TEST_F(AuthorizedHttpClientTest, NoRetryOnOtherErrors) {
  EXPECT_CALL(*mock_, Get).WillOnce([](RestContext&, RestRequest const&) {
    return MakeMockResponse(500, "oops");
  });
  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto response = client.Get(context, RestRequest("https://example.com/"));
  ASSERT_STATUS_OK(response);
  EXPECT_EQ((*response)->StatusCode(), 500);
  EXPECT_EQ(credentials_->refresh_clients.size(), 1U);
}

TEST_F(AuthorizedHttpClientTest, RefreshFailureStopsRequest) {
  credentials_->next_status =
      internal::UnauthenticatedError("bad credentials", CLOUDAUTH_ERROR_INFO());
  EXPECT_CALL(*mock_, Get).Times(0);
  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto response = client.Get(context, RestRequest("https://example.com/"));
  EXPECT_THAT(response,
              StatusIs(StatusCode::kUnauthenticated, "bad credentials"));
}

TEST_F(AuthorizedHttpClientTest, TransportErrorNotRetried) {
  EXPECT_CALL(*mock_, Get)
      .WillOnce([](RestContext&, RestRequest const&)
                    -> StatusOr<std::unique_ptr<RestResponse>> {
        return internal::UnavailableError("connection reset",
                                          CLOUDAUTH_ERROR_INFO());
      });
  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto response = client.Get(context, RestRequest("https://example.com/"));
  EXPECT_THAT(response,
              StatusIs(StatusCode::kUnavailable, "connection reset"));
}

TEST_F(AuthorizedHttpClientTest, SeparateRefreshClient) {
  auto refresh = std::make_shared<MockRestClient>();
  EXPECT_CALL(*mock_, Get).WillOnce([](RestContext&, RestRequest const&) {
    return MakeMockResponse(200, "ok");
  });
  AuthorizedHttpClient client(credentials_, mock_, {}, refresh);
  RestContext context;
  ASSERT_STATUS_OK(client.Get(context, RestRequest("https://example.com/")));
  ASSERT_EQ(credentials_->refresh_clients.size(), 1U);
  EXPECT_EQ(credentials_->refresh_clients.front(), refresh.get());

  AuthorizedHttpClient same(credentials_, mock_);
  EXPECT_EQ(same.credentials(), credentials_);
}

TEST_F(AuthorizedHttpClientTest, PayloadVerbs) {
  std::string const body = "{}";
  Payload const payload{absl::MakeConstSpan(body.data(), body.size())};
  EXPECT_CALL(*mock_, Post(_, _, A<Payload const&>()))
      .WillOnce([](RestContext&, RestRequest const& request,
                   Payload const& p) {
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        EXPECT_EQ(p.size(), 1U);
        return MakeMockResponse(200, "post");
      });
  EXPECT_CALL(*mock_, Post(_, _, A<FormData const&>()))
      .WillOnce([](RestContext&, RestRequest const& request,
                   FormData const& form) {
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        EXPECT_THAT(form, ElementsAre(Pair("k", "v")));
        return MakeMockResponse(200, "form");
      });
  EXPECT_CALL(*mock_, Put).WillOnce([](RestContext&, RestRequest const&,
                                       Payload const&) {
    return MakeMockResponse(200, "put");
  });
  EXPECT_CALL(*mock_, Patch)
      .WillOnce([](RestContext&, RestRequest const& request, Payload const&) {
        EXPECT_EQ(Authorization(request), "Bearer token-1");
        return MakeMockResponse(200, "patch");
      });

  AuthorizedHttpClient client(credentials_, mock_);
  RestContext context;
  auto const request = RestRequest("https://example.com/");
  EXPECT_STATUS_OK(client.Post(context, request, payload));
  EXPECT_STATUS_OK(client.Post(context, request, FormData{{"k", "v"}}));
  EXPECT_STATUS_OK(client.Put(context, request, payload));
  EXPECT_STATUS_OK(client.Patch(context, request, payload));
}

}  // namespace
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
