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

#ifndef CLOUDAUTH_OAUTH2_GOOGLE_DEFAULT_CREDENTIALS_H
#define CLOUDAUTH_OAUTH2_GOOGLE_DEFAULT_CREDENTIALS_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/oauth2/http_client_factory.h"
#include "cloudauth/options.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <memory>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// Credentials found by the default resolver, and the project they belong to.
struct DefaultCredentials {
  std::shared_ptr<Credentials> credentials;
  /// Absent if the project could not be determined.
  absl::optional<std::string> project_id;
};

/**
 * Loads credentials from a JSON key file.
 *
 * `authorized_user` files produce `UserCredentials`, using `TokenUriOption`
 * as the token endpoint, and no project id. `service_account` files produce
 * `JwtCredentials` and the `project_id` in the file. Other types fail with
 * `INVALID_CREDENTIAL_TYPE`.
 */
StatusOr<DefaultCredentials> LoadCredentialsFromFile(
    std::string const& path, Options const& options = {});

/**
 * @name The steps of the default credential resolution.
 *
 * Each step returns an empty optional if its source is not available, and an
 * error if the source is available but unusable.
 */
///@{

/// Loads the file named by `GOOGLE_APPLICATION_CREDENTIALS`, if set.
StatusOr<absl::optional<DefaultCredentials>> GetExplicitEnvironCredentials(
    Options const& options = {});

/**
 * Loads the application default credentials created by the Cloud SDK.
 *
 * The file is `application_default_credentials.json` in
 * `GcloudSdkConfigDirectory()`. If the file has no project id, the project
 * configured in the Cloud SDK is used.
 */
StatusOr<absl::optional<DefaultCredentials>> GetGcloudSdkCredentials(
    Options const& options = {});

/// App Engine standard credentials are not supported, always empty.
StatusOr<absl::optional<DefaultCredentials>> GetAppEngineCredentials();

/**
 * Returns `ComputeEngineCredentials` if the metadata server is reachable.
 *
 * The project id is fetched from the metadata server. Failures to fetch it are
 * logged and leave the project id empty.
 */
StatusOr<absl::optional<DefaultCredentials>> GetComputeEngineCredentials(
    rest_internal::RestClient& client, Options const& options = {});
///@}

/**
 * Returns the Cloud SDK configuration directory.
 *
 * This is `CLOUDSDK_CONFIG` if set, otherwise `$HOME/.config/gcloud`. On
 * Windows it is `%APPDATA%\gcloud`, or `%SystemDrive%\gcloud` if `APPDATA`
 * is not set.
 */
std::string GcloudSdkConfigDirectory();

/**
 * Reads the `project` in the `[core]` section of the active Cloud SDK
 * configuration, `<config_dir>/configurations/config_default`.
 *
 * Returns an empty optional if the file, section or key do not exist, or the
 * file is malformed.
 */
absl::optional<std::string> GetGcloudSdkProjectId(
    std::string const& config_dir);

/**
 * Finds the credentials for the current environment.
 *
 * The sources are checked in order, and the first one found is returned:
 * -# the file named by `GOOGLE_APPLICATION_CREDENTIALS`,
 * -# the Cloud SDK application default credentials,
 * -# App Engine standard (not supported),
 * -# the Compute Engine metadata server.
 *
 * The `GCLOUD_PROJECT` environment variable overrides the project id. If no
 * source is available the function returns `NO_CREDENTIALS_FOUND`.
 *
 * @param client_factory creates the client used to ping the metadata server.
 *     If empty, `rest_internal::MakeDefaultRestClient()` is used.
 *
 * @see https://developers.google.com/accounts/docs/application-default-credentials
 */
StatusOr<DefaultCredentials> GoogleDefaultCredentials(
    Options const& options = {}, HttpClientFactory client_factory = {});

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_GOOGLE_DEFAULT_CREDENTIALS_H
