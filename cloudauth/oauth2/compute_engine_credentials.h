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

#ifndef CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_CREDENTIALS_H

#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * Credentials for the service account attached to a Compute Engine instance.
 *
 * Access tokens are obtained from the instance metadata server. The scopes
 * are set when the instance is created, so these credentials never require
 * scopes and `WithScopes()` always fails.
 *
 * @see https://cloud.google.com/compute/docs/access/create-enable-service-accounts-for-instances
 */
class ComputeEngineCredentials : public Credentials, public Scoped {
 public:
  /**
   * Creates an instance of ComputeEngineCredentials.
   *
   * @param service_account_email the account email, or an alias such as
   *     `default`.
   * @param options configures the metadata server host.
   * @param current_time_fn a dependency injection point to fetch the current
   *     time. This should generally not be overridden except for testing.
   */
  explicit ComputeEngineCredentials(
      std::string service_account_email = "default", Options options = {},
      CurrentTimeFn current_time_fn = std::chrono::system_clock::now);

  /**
   * Fetches a new token from the metadata server.
   *
   * Metadata server errors are reported as `REFRESH_FAILED`.
   */
  Status Refresh(rest_internal::RestClient& client) override;

  /**
   * Fetches the service account email and scopes from the metadata server.
   *
   * Until this is called `service_account_email()` may return an alias and
   * `scopes()` is absent.
   */
  Status RetrieveServiceAccountInfo(rest_internal::RestClient& client);

  std::string const& service_account_email() const {
    return service_account_email_;
  }

  absl::optional<std::vector<std::string>> scopes() const override {
    return scopes_;
  }
  bool requires_scopes() const override { return false; }
  StatusOr<std::shared_ptr<Credentials>> WithScopes(
      std::vector<std::string> scopes) const override;

 private:
  std::string service_account_email_;
  absl::optional<std::vector<std::string>> scopes_;
  Options options_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_CREDENTIALS_H
