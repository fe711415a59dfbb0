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

#ifndef CLOUDAUTH_OAUTH2_OPTIONS_H
#define CLOUDAUTH_OAUTH2_OPTIONS_H

#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include <chrono>
#include <set>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// The default OAuth2 token endpoint for `authorized_user` credentials.
auto constexpr kGoogleOAuthTokenUri =
    "https://accounts.google.com/o/oauth2/token";

/**
 * Override the OAuth2 token endpoint used by `authorized_user` credentials.
 *
 * The default is `kGoogleOAuthTokenUri`.
 */
struct TokenUriOption {
  using Type = std::string;
};

/**
 * The host (and optional port) of the instance metadata server.
 *
 * If unset, the `GCE_METADATA_HOST` environment variable is used, and then
 * `metadata.google.internal`.
 */
struct MetadataHostOption {
  using Type = std::string;
};

/// How long to wait for the metadata server to answer a ping. Default 3s.
struct MetadataPingTimeoutOption {
  using Type = std::chrono::milliseconds;
};

/**
 * The HTTP status codes that indicate stale credentials.
 *
 * `AuthorizedHttpClient` refreshes the credentials and retries the request
 * when the response status is in this set. Default `{401}`.
 */
struct RefreshStatusCodesOption {
  using Type = std::set<int>;
};

/**
 * The maximum number of refresh-and-retry cycles per request in
 * `AuthorizedHttpClient`. Default 2.
 */
struct MaxRefreshAttemptsOption {
  using Type = int;
};

/// The lifetime of self-signed JWTs. Default 3600s.
struct JwtTokenLifetimeOption {
  using Type = std::chrono::seconds;
};

auto constexpr kDefaultMetadataPingTimeout = std::chrono::seconds(3);
auto constexpr kDefaultMaxRefreshAttempts = 2;

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_OPTIONS_H
