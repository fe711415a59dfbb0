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

#ifndef CLOUDAUTH_OAUTH2_OAUTH2_CLIENT_H
#define CLOUDAUTH_OAUTH2_OAUTH2_CLIENT_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * @file
 *
 * A client for the token endpoint of an OAuth 2.0 authorization server.
 *
 * @see https://tools.ietf.org/html/rfc6749#section-3.2
 */

/// The `grant_type` for the JWT profile of OAuth 2.0 (RFC 7523).
auto constexpr kJwtGrantType = "urn:ietf:params:oauth:grant-type:jwt-bearer";

/// The `grant_type` for the refresh token grant (RFC 6749 section 6).
auto constexpr kRefreshGrantType = "refresh_token";

struct GrantResult {
  std::string access_token;
  absl::optional<std::chrono::system_clock::time_point> expiry;
  /// The full token endpoint response.
  nlohmann::json raw_response;
};

struct RefreshGrantResult {
  std::string access_token;
  /// The new refresh token, or the one in the request if the server did not
  /// rotate it.
  std::string refresh_token;
  absl::optional<std::chrono::system_clock::time_point> expiry;
  nlohmann::json raw_response;
};

/**
 * Exchanges a signed JWT @p assertion for an access token.
 *
 * @see https://tools.ietf.org/html/rfc7523#section-4
 */
StatusOr<GrantResult> JwtGrant(rest_internal::RestClient& client,
                               std::string const& token_uri,
                               std::string const& assertion,
                               std::chrono::system_clock::time_point now);

/**
 * Exchanges a refresh token for a new access token.
 *
 * @see https://tools.ietf.org/html/rfc6749#section-6
 */
StatusOr<RefreshGrantResult> RefreshGrant(
    rest_internal::RestClient& client, std::string const& token_uri,
    std::string const& refresh_token, std::string const& client_id,
    std::string const& client_secret,
    std::chrono::system_clock::time_point now);

/**
 * Formats the error details in a token endpoint error response.
 *
 * Returns `"<error>: <error_description>"` when @p payload is a JSON object
 * with both fields, or @p payload itself otherwise.
 */
std::string TokenEndpointErrorDetails(std::string const& payload);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_OAUTH2_CLIENT_H
