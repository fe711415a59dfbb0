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

#ifndef CLOUDAUTH_OAUTH2_USER_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_USER_CREDENTIALS_H

#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// Object to hold information used to instantiate a UserCredentials.
struct UserCredentialsInfo {
  /// An initial access token, if any.
  absl::optional<std::string> token;
  std::string refresh_token;
  std::string token_uri;
  std::string client_id;
  std::string client_secret;
  /// The scopes used to authorize the refresh token, informational only.
  absl::optional<std::vector<std::string>> scopes;
};

/**
 * Parses the contents of an `authorized_user` file.
 *
 * `refresh_token`, `client_id` and `client_secret` are required.
 *
 * @param source describes where @p info came from, used in error messages.
 */
StatusOr<UserCredentialsInfo> ParseAuthorizedUserInfo(
    nlohmann::json const& info, std::string const& source,
    std::string const& token_uri = kGoogleOAuthTokenUri);

/**
 * OAuth 2.0 credentials for a user account.
 *
 * Access tokens are obtained from the token endpoint using the refresh token
 * grant. The scopes are fixed when the user authorizes the refresh token and
 * cannot be changed, `WithScopes()` always fails.
 *
 * @see https://developers.google.com/identity/protocols/OAuth2
 */
class UserCredentials : public Credentials, public Scoped {
 public:
  explicit UserCredentials(
      UserCredentialsInfo info,
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /**
   * Exchanges the refresh token for a new access token.
   *
   * Fails with `REFRESH_FAILED` if any of the refresh fields is empty. If the
   * server returns a new refresh token it replaces the current one.
   */
  Status Refresh(rest_internal::RestClient& client) override;

  absl::optional<std::vector<std::string>> scopes() const override {
    return info_.scopes;
  }
  bool requires_scopes() const override { return false; }
  StatusOr<std::shared_ptr<Credentials>> WithScopes(
      std::vector<std::string> scopes) const override;

  std::string const& refresh_token() const { return info_.refresh_token; }
  std::string const& token_uri() const { return info_.token_uri; }
  std::string const& client_id() const { return info_.client_id; }
  std::string const& client_secret() const { return info_.client_secret; }

 private:
  UserCredentialsInfo info_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_USER_CREDENTIALS_H
