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

#ifndef CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_CREDENTIALS_H

#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/oauth2/jwt.h"
#include "cloudauth/options.h"
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

/// Object to hold information used to instantiate a ServiceAccountCredentials.
struct ServiceAccountCredentialsInfo {
  std::string service_account_email;
  std::string token_uri;
  absl::optional<std::vector<std::string>> scopes;
  /// The user to impersonate with domain-wide delegation.
  absl::optional<std::string> subject;
  nlohmann::json additional_claims = nlohmann::json::object();
};

/**
 * OAuth 2.0 credentials for a service account.
 *
 * A signed JWT assertion is exchanged for an access token at the token
 * endpoint. The assertion carries the scopes, so these credentials require
 * scopes before they can be used.
 *
 * @see https://developers.google.com/identity/protocols/OAuth2ServiceAccount
 */
class ServiceAccountCredentials : public Credentials,
                                  public Scoped,
                                  public Signing {
 public:
  ServiceAccountCredentials(
      std::shared_ptr<Signer const> signer, ServiceAccountCredentialsInfo info,
      Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /**
   * Creates credentials from the contents of a `service_account` key file.
   *
   * @p scopes and @p subject are applied to the new credentials.
   */
  static StatusOr<std::shared_ptr<ServiceAccountCredentials>>
  FromServiceAccountInfo(
      nlohmann::json const& info,
      absl::optional<std::vector<std::string>> scopes = {},
      absl::optional<std::string> subject = {}, Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /// Creates credentials from a `service_account` key file.
  static StatusOr<std::shared_ptr<ServiceAccountCredentials>>
  FromServiceAccountFile(
      std::string const& path,
      absl::optional<std::vector<std::string>> scopes = {},
      absl::optional<std::string> subject = {}, Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /// Signs an assertion and exchanges it at the token endpoint.
  Status Refresh(rest_internal::RestClient& client) override;

  absl::optional<std::vector<std::string>> scopes() const override {
    return info_.scopes;
  }
  bool requires_scopes() const override;
  StatusOr<std::shared_ptr<Credentials>> WithScopes(
      std::vector<std::string> scopes) const override;

  /// Returns a copy of these credentials that impersonates @p subject.
  std::shared_ptr<ServiceAccountCredentials> WithSubject(
      std::string subject) const;

  StatusOr<std::string> SignBytes(std::string const& message) const override;
  absl::optional<std::string> signer_email() const override {
    return info_.service_account_email;
  }
  std::shared_ptr<Signer const> signer() const override { return signer_; }

  std::string const& service_account_email() const {
    return info_.service_account_email;
  }
  std::string const& token_uri() const { return info_.token_uri; }
  absl::optional<std::string> const& subject() const { return info_.subject; }

 private:
  StatusOr<std::string> MakeAssertion(
      std::chrono::system_clock::time_point now) const;

  std::shared_ptr<Signer const> signer_;
  ServiceAccountCredentialsInfo info_;
  Options options_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_CREDENTIALS_H
