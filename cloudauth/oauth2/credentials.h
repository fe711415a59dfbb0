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

#ifndef CLOUDAUTH_OAUTH2_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_CREDENTIALS_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/internal/rest_request.h"
#include "cloudauth/oauth2/jwt.h"
#include "cloudauth/status.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// A dependency injection point for the current time.
using CurrentTimeFn =
    std::function<std::chrono::time_point<std::chrono::system_clock>()>;

/**
 * Interface for the credential types.
 *
 * A credential holds an optional bearer token and its expiry. `Refresh()` is
 * the only operation that obtains a new token. `BeforeRequest()` refreshes
 * the token when needed and adds it to the request headers.
 *
 * Instances are not synchronized: callers that share a credential between
 * threads must serialize calls to `Refresh()` and `BeforeRequest()`.
 */
class Credentials {
 public:
  virtual ~Credentials() = default;

  /// The current bearer token, absent until the first successful refresh.
  absl::optional<std::string> const& token() const { return token_; }

  /// When the current token expires. Absent means it does not expire.
  absl::optional<std::chrono::system_clock::time_point> const& expiry()
      const {
    return expiry_;
  }

  /// True if the token has an expiry and it is not in the future.
  bool expired() const;

  /// True if there is a token and it has not expired.
  bool valid() const;

  /**
   * Obtains a new access token.
   *
   * On failure the token and expiry are unchanged.
   *
   * @param client used to contact the token issuer, if any.
   */
  virtual Status Refresh(rest_internal::RestClient& client) = 0;

  /**
   * Prepares the headers for an HTTP request.
   *
   * The default implementation calls `Refresh()` if the credentials are not
   * valid, and then `Apply()`.
   */
  virtual Status BeforeRequest(rest_internal::RestClient& client,
                               std::string const& method,
                               std::string const& url,
                               rest_internal::HttpHeaders& headers);

  /**
   * Sets the `authorization` header to `Bearer <token>`.
   *
   * Uses @p token if present, otherwise the current token. Any previous
   * `authorization` value is replaced.
   */
  void Apply(rest_internal::HttpHeaders& headers,
             absl::optional<std::string> token = {}) const;

 protected:
  explicit Credentials(
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now)
      : current_time_fn_(std::move(current_time_fn)) {}

  void SetToken(std::string token,
                absl::optional<std::chrono::system_clock::time_point> expiry);

  std::chrono::system_clock::time_point Now() const {
    return current_time_fn_();
  }
  CurrentTimeFn const& current_time_fn() const { return current_time_fn_; }

 private:
  CurrentTimeFn current_time_fn_;
  absl::optional<std::string> token_;
  absl::optional<std::chrono::system_clock::time_point> expiry_;
};

/**
 * Capability implemented by credentials with OAuth2 scopes.
 *
 * Scoped credentials are immutable with respect to their scopes,
 * `WithScopes()` returns a new instance.
 */
class Scoped {
 public:
  virtual ~Scoped() = default;

  /// The scopes, absent if none were requested.
  virtual absl::optional<std::vector<std::string>> scopes() const = 0;

  /// True if the credentials cannot be used until scopes are set.
  virtual bool requires_scopes() const = 0;

  /// True if every scope in @p scopes is in `scopes()`.
  bool HasScopes(std::vector<std::string> const& scopes) const;

  /// Same as above, with @p scopes separated by spaces.
  bool HasScopes(std::string const& scopes) const;

  /// Returns a copy of these credentials with @p scopes.
  virtual StatusOr<std::shared_ptr<Credentials>> WithScopes(
      std::vector<std::string> scopes) const = 0;
};

/// Capability implemented by credentials that can sign arbitrary bytes.
class Signing {
 public:
  virtual ~Signing() = default;

  /// Signs @p message with the credentials' private key.
  virtual StatusOr<std::string> SignBytes(std::string const& message) const = 0;

  /// The email of the account that signs, if known.
  virtual absl::optional<std::string> signer_email() const = 0;

  virtual std::shared_ptr<Signer const> signer() const = 0;
};

/**
 * Applies @p scopes to @p credentials if they require scopes.
 *
 * Credentials that are not `Scoped`, or do not require scopes, are returned
 * unchanged.
 */
StatusOr<std::shared_ptr<Credentials>> WithScopesIfRequired(
    std::shared_ptr<Credentials> credentials, std::vector<std::string> scopes);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_CREDENTIALS_H
