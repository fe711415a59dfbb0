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

#include "cloudauth/oauth2/oauth2_client.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/oauth2/errors.h"
#include "absl/strings/str_cat.h"
#include <cstdint>
#include <utility>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

using FormData = std::vector<std::pair<std::string, std::string>>;

StatusOr<nlohmann::json> TokenEndpointRequest(rest_internal::RestClient& client,
                                              std::string const& token_uri,
                                              FormData const& form_data) {
  rest_internal::RestContext context;
  auto request = rest_internal::RestRequest(token_uri).AddHeader(
      "content-type", "application/x-www-form-urlencoded");
  auto response = client.Post(context, request, form_data);
  if (!response) {
    auto status = std::move(response).status();
    if (IsTransportError(status)) return status;
    return internal::TransportError(
        absl::StrCat("Token endpoint request failed: ", status.message()),
        CLOUDAUTH_ERROR_INFO().WithMetadata("token_uri", token_uri));
  }
  auto const status_code = (*response)->StatusCode();
  auto payload = rest_internal::ReadAll(std::move(**response).ExtractPayload());
  if (!payload) return std::move(payload).status();
  if (status_code != rest_internal::HttpStatusCode::kOk) {
    return internal::RefreshError(
        TokenEndpointErrorDetails(*payload),
        CLOUDAUTH_ERROR_INFO()
            .WithMetadata("token_uri", token_uri)
            .WithMetadata("http_status_code", std::to_string(status_code)));
  }
  auto json = nlohmann::json::parse(*payload, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return internal::RefreshError(
        absl::StrCat("Invalid JSON in token endpoint response: ", *payload),
        CLOUDAUTH_ERROR_INFO().WithMetadata("token_uri", token_uri));
  }
  if (!json.contains("access_token") || !json["access_token"].is_string()) {
    return internal::RefreshError(
        "No access token in response.",
        CLOUDAUTH_ERROR_INFO().WithMetadata("token_uri", token_uri));
  }
  return json;
}

absl::optional<std::chrono::system_clock::time_point> ParseExpiry(
    nlohmann::json const& response, std::chrono::system_clock::time_point now) {
  auto const i = response.find("expires_in");
  if (i == response.end() || !i->is_number()) return absl::nullopt;
  auto const expires_in = i->get<std::int64_t>();
  if (expires_in == 0) return absl::nullopt;
  return now + std::chrono::seconds(expires_in);
}

}  // namespace

std::string TokenEndpointErrorDetails(std::string const& payload) {
  auto json = nlohmann::json::parse(payload, nullptr, false);
  if (json.is_discarded() || !json.is_object()) return payload;
  auto const error = json.find("error");
  auto const description = json.find("error_description");
  if (error == json.end() || !error->is_string() ||
      description == json.end() || !description->is_string()) {
    return payload;
  }
  return absl::StrCat(error->get<std::string>(), ": ",
                      description->get<std::string>());
}

StatusOr<GrantResult> JwtGrant(rest_internal::RestClient& client,
                               std::string const& token_uri,
                               std::string const& assertion,
                               std::chrono::system_clock::time_point now) {
  auto response = TokenEndpointRequest(
      client, token_uri,
      {{"assertion", assertion}, {"grant_type", kJwtGrantType}});
  if (!response) return std::move(response).status();
  GrantResult result;
  result.access_token = (*response)["access_token"].get<std::string>();
  result.expiry = ParseExpiry(*response, now);
  result.raw_response = *std::move(response);
  return result;
}

StatusOr<RefreshGrantResult> RefreshGrant(
    rest_internal::RestClient& client, std::string const& token_uri,
    std::string const& refresh_token, std::string const& client_id,
    std::string const& client_secret,
    std::chrono::system_clock::time_point now) {
  auto response = TokenEndpointRequest(client, token_uri,
                                       {{"grant_type", kRefreshGrantType},
                                        {"client_id", client_id},
                                        {"client_secret", client_secret},
                                        {"refresh_token", refresh_token}});
  if (!response) return std::move(response).status();
  RefreshGrantResult result;
  result.access_token = (*response)["access_token"].get<std::string>();
  result.refresh_token = refresh_token;
  auto const rotated = response->find("refresh_token");
  if (rotated != response->end() && rotated->is_string()) {
    result.refresh_token = rotated->get<std::string>();
  }
  result.expiry = ParseExpiry(*response, now);
  result.raw_response = *std::move(response);
  return result;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
