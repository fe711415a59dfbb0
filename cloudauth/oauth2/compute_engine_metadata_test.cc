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

#include "cloudauth/oauth2/compute_engine_metadata.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/internal/rest_options.h"
#include "cloudauth/oauth2/errors.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/testing_util/mock_rest_client.h"
#include "cloudauth/testing_util/scoped_environment.h"
#include "cloudauth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <chrono>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::cloudauth::rest_internal::RestContext;
using ::cloudauth::rest_internal::RestRequest;
using ::cloudauth::rest_internal::TransferTimeoutOption;
using ::cloudauth::testing_util::IsOkAndHolds;
using ::cloudauth::testing_util::MakeMockJsonResponse;
using ::cloudauth::testing_util::MakeMockResponse;
using ::cloudauth::testing_util::MockRestClient;
using ::cloudauth::testing_util::ScopedEnvironment;
using ::cloudauth::testing_util::StatusIs;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Pair;

auto constexpr kRoot = "http://metadata.google.internal/computeMetadata/v1/";

class ComputeEngineMetadataTest : public ::testing::Test {
 protected:
  ScopedEnvironment host_{"GCE_METADATA_HOST", absl::nullopt};
  MockRestClient client_;
};

TEST_F(ComputeEngineMetadataTest, HostResolution) {
  EXPECT_EQ(MetadataHost(), "metadata.google.internal");
  EXPECT_EQ(MetadataRootUrl(), kRoot);
  EXPECT_EQ(MetadataPingUrl(), "http://metadata.google.internal/");

  ScopedEnvironment env("GCE_METADATA_HOST", "localhost:8080");
  EXPECT_EQ(MetadataHost(), "localhost:8080");
  EXPECT_EQ(MetadataRootUrl(), "http://localhost:8080/computeMetadata/v1/");

  auto const options = Options{}.set<MetadataHostOption>("10.0.0.1");
  EXPECT_EQ(MetadataHost(options), "10.0.0.1");
  EXPECT_EQ(MetadataPingUrl(options), "http://10.0.0.1/");
}

TEST_F(ComputeEngineMetadataTest, PingSuccess) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext& context, RestRequest const& request) {
        EXPECT_EQ(request.path(), "http://metadata.google.internal/");
        EXPECT_THAT(request.GetHeader("metadata-flavor"),
                    ElementsAre("Google"));
        EXPECT_EQ(context.options().get<TransferTimeoutOption>(),
                  std::chrono::seconds(3));
        return MakeMockResponse(200, "", {{"metadata-flavor", "Google"}});
      });
  EXPECT_TRUE(Ping(client_));
}

TEST_F(ComputeEngineMetadataTest, PingTimeoutOption) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext& context, RestRequest const&) {
        EXPECT_EQ(context.options().get<TransferTimeoutOption>(),
                  std::chrono::milliseconds(250));
        return MakeMockResponse(200, "");
      });
  EXPECT_TRUE(Ping(client_, Options{}.set<MetadataPingTimeoutOption>(
                                std::chrono::milliseconds(250))));
}

TEST_F(ComputeEngineMetadataTest, PingFailures) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(200, "", {{"metadata-flavor", "Other"}});
      })
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(404, "not found");
      })
      .WillOnce(
          [](RestContext&, RestRequest const&)
              -> StatusOr<std::unique_ptr<rest_internal::RestResponse>> {
            return internal::UnavailableError("connection refused",
                                              CLOUDAUTH_ERROR_INFO());
          });
  EXPECT_FALSE(Ping(client_));
  EXPECT_FALSE(Ping(client_));
  EXPECT_FALSE(Ping(client_));
}

TEST_F(ComputeEngineMetadataTest, GetText) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(request.path(), std::string(kRoot) + "project/project-id");
        EXPECT_THAT(request.GetHeader("metadata-flavor"),
                    ElementsAre("Google"));
        EXPECT_THAT(request.parameters(), IsEmpty());
        return MakeMockResponse(200, "test-project",
                                {{"content-type", "application/text"}});
      });
  auto value = Get(client_, "project/project-id");
  ASSERT_STATUS_OK(value);
  EXPECT_FALSE(value->is_json());
  EXPECT_EQ(value->text(), "test-project");
  EXPECT_TRUE(value->json().is_null());
}

TEST_F(ComputeEngineMetadataTest, GetJsonRecursive) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_THAT(request.parameters(),
                    ElementsAre(Pair("recursive", "true")));
        return MakeMockJsonResponse(200, R"js({"a": 1})js");
      });
  auto value = Get(client_, "instance/", {}, /*recursive=*/true);
  ASSERT_STATUS_OK(value);
  EXPECT_TRUE(value->is_json());
  EXPECT_EQ(value->json(), nlohmann::json({{"a", 1}}));
}

TEST_F(ComputeEngineMetadataTest, GetErrors) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(404, "not here");
      })
      .WillOnce(
          [](RestContext&, RestRequest const&)
              -> StatusOr<std::unique_ptr<rest_internal::RestResponse>> {
            return internal::UnavailableError("connection refused",
                                              CLOUDAUTH_ERROR_INFO());
          })
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockJsonResponse(200, "{not-json");
      });

  auto value = Get(client_, "project/project-id");
  EXPECT_THAT(value, StatusIs(StatusCode::kUnavailable,
                              AllOf(HasSubstr("Status: 404"),
                                    HasSubstr("not here"))));
  EXPECT_TRUE(IsTransportError(value.status()));

  value = Get(client_, "project/project-id");
  EXPECT_THAT(value,
              StatusIs(StatusCode::kUnavailable,
                       AllOf(HasSubstr("Failed to retrieve"),
                             HasSubstr("connection refused"))));
  EXPECT_TRUE(IsTransportError(value.status()));

  value = Get(client_, "instance/");
  EXPECT_TRUE(IsTransportError(value.status()));
}

TEST_F(ComputeEngineMetadataTest, GetServiceAccountToken) {
  auto const now = std::chrono::system_clock::now();
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(request.path(),
                  std::string(kRoot) +
                      "instance/service-accounts/default/token");
        return MakeMockJsonResponse(
            200, R"js({"access_token": "at", "expires_in": 3599,
                       "token_type": "Bearer"})js");
      });
  auto token = GetServiceAccountToken(client_, now);
  ASSERT_STATUS_OK(token);
  EXPECT_EQ(token->token, "at");
  EXPECT_EQ(token->expiration, now + std::chrono::seconds(3599));
}

TEST_F(ComputeEngineMetadataTest, GetServiceAccountTokenErrors) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_THAT(request.path(), HasSubstr("/service-accounts/sa@x/"));
        return MakeMockJsonResponse(200, R"js({"expires_in": 3599})js");
      })
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(500, "oops");
      });
  auto const now = std::chrono::system_clock::now();
  auto token = GetServiceAccountToken(client_, now, "sa@x");
  EXPECT_TRUE(IsRefreshError(token.status()));
  token = GetServiceAccountToken(client_, now, "sa@x");
  EXPECT_TRUE(IsTransportError(token.status()));
}

TEST_F(ComputeEngineMetadataTest, GetServiceAccountInfo) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(request.path(),
                  std::string(kRoot) + "instance/service-accounts/default/");
        EXPECT_THAT(request.parameters(),
                    ElementsAre(Pair("recursive", "true")));
        return MakeMockJsonResponse(
            200, R"js({"email": "sa@test.iam.gserviceaccount.com",
                       "scopes": ["s1", "s2"]})js");
      })
      .WillOnce([](RestContext&, RestRequest const&) {
        return MakeMockResponse(200, "plain text");
      });
  auto info = GetServiceAccountInfo(client_);
  ASSERT_STATUS_OK(info);
  EXPECT_EQ(info->value("email", ""), "sa@test.iam.gserviceaccount.com");

  info = GetServiceAccountInfo(client_);
  EXPECT_TRUE(IsTransportError(info.status()));
}

TEST_F(ComputeEngineMetadataTest, GetProjectId) {
  EXPECT_CALL(client_, Get)
      .WillOnce([](RestContext&, RestRequest const& request) {
        EXPECT_EQ(request.path(), std::string(kRoot) + "project/project-id");
        return MakeMockResponse(200, "test-project");
      });
  EXPECT_THAT(GetProjectId(client_), IsOkAndHolds("test-project"));
}

}  // namespace
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
