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

#ifndef CLOUDAUTH_OAUTH2_JWT_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_JWT_CREDENTIALS_H

#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/oauth2/jwt.h"
#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// The claims of the tokens created by `JwtCredentials`.
struct JwtClaims {
  /// The `iss` claim.
  absl::optional<std::string> issuer;
  /// The `sub` claim, defaults to the issuer.
  absl::optional<std::string> subject;
  /// The `aud` claim. If absent or empty, each request gets a one-time token.
  absl::optional<std::string> audience;
  /// Merged into the payload, overriding the claims above.
  nlohmann::json additional_claims = nlohmann::json::object();
};

/**
 * Credentials that use a self-signed JWT as the bearer token.
 *
 * No token endpoint is involved, `Refresh()` signs a new token locally. When
 * the claims have no audience, `BeforeRequest()` mints a one-time token whose
 * audience is the request URL, without the query or fragment. Such tokens are
 * never stored.
 *
 * The token lifetime is `JwtTokenLifetimeOption`.
 *
 * @see https://developers.google.com/identity/protocols/OAuth2ServiceAccount#jwt-auth
 */
class JwtCredentials : public Credentials, public Signing {
 public:
  JwtCredentials(
      std::shared_ptr<Signer const> signer, JwtClaims claims,
      Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /**
   * Creates credentials from the contents of a `service_account` key file.
   *
   * The issuer and the default subject are the `client_email` field.
   */
  static StatusOr<std::shared_ptr<JwtCredentials>> FromServiceAccountInfo(
      nlohmann::json const& info, JwtClaims claims = {}, Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /// Creates credentials from a `service_account` key file.
  static StatusOr<std::shared_ptr<JwtCredentials>> FromServiceAccountFile(
      std::string const& path, JwtClaims claims = {}, Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /**
   * Returns a copy of these credentials with modified claims.
   *
   * Claims present in @p claims replace the current ones. The additional
   * claims are merged.
   */
  std::shared_ptr<JwtCredentials> WithClaims(JwtClaims const& claims) const;

  Status Refresh(rest_internal::RestClient& client) override;
  Status BeforeRequest(rest_internal::RestClient& client,
                       std::string const& method, std::string const& url,
                       rest_internal::HttpHeaders& headers) override;

  StatusOr<std::string> SignBytes(std::string const& message) const override;
  absl::optional<std::string> signer_email() const override {
    return claims_.issuer;
  }
  std::shared_ptr<Signer const> signer() const override { return signer_; }

  JwtClaims const& claims() const { return claims_; }

 private:
  struct SignedJwt {
    std::string token;
    std::chrono::system_clock::time_point expiry;
  };
  StatusOr<SignedJwt> MakeJwt(
      absl::optional<std::string> const& audience) const;

  std::shared_ptr<Signer const> signer_;
  JwtClaims claims_;
  Options options_;
};

/// Removes the query and fragment from @p url.
std::string StripQueryAndFragment(std::string const& url);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_JWT_CREDENTIALS_H
