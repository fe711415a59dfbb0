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

#ifndef CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_METADATA_H
#define CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_METADATA_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/oauth2/access_token.h"
#include "cloudauth/options.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * @file
 *
 * Helpers to query the Google Compute Engine metadata server.
 *
 * The metadata server is only reachable from GCE, GKE, Cloud Run and similar
 * environments. All requests carry the `metadata-flavor: Google` header.
 *
 * @see https://cloud.google.com/compute/docs/metadata/overview
 */

/**
 * Returns the metadata server host.
 *
 * The host is taken from `MetadataHostOption`, then the `GCE_METADATA_HOST`
 * environment variable, and defaults to `metadata.google.internal`.
 */
std::string MetadataHost(Options const& options = {});

/// The root URL for metadata queries, `http://<host>/computeMetadata/v1/`.
std::string MetadataRootUrl(Options const& options = {});

/// The URL used to detect the metadata server, `http://<host>/`.
std::string MetadataPingUrl(Options const& options = {});

/// A metadata value, parsed as JSON if the server returned JSON.
class MetadataValue {
 public:
  explicit MetadataValue(std::string text, nlohmann::json json = nullptr,
                         bool is_json = false)
      : text_(std::move(text)), json_(std::move(json)), is_json_(is_json) {}

  bool is_json() const { return is_json_; }
  /// The raw response body.
  std::string const& text() const { return text_; }
  /// The parsed body, `null` unless `is_json()` is true.
  nlohmann::json const& json() const { return json_; }

 private:
  std::string text_;
  nlohmann::json json_;
  bool is_json_;
};

/**
 * Returns true if the metadata server is reachable.
 *
 * The request uses `MetadataPingTimeoutOption` as its timeout. Transport
 * errors are logged and reported as `false`.
 */
bool Ping(rest_internal::RestClient& client, Options const& options = {});

/**
 * Fetches a value from the metadata server.
 *
 * @param path the path relative to the metadata root, e.g.
 *     `project/project-id`.
 * @param recursive if true, adds `?recursive=true` to fetch a whole directory.
 */
StatusOr<MetadataValue> Get(rest_internal::RestClient& client,
                            std::string const& path,
                            Options const& options = {},
                            bool recursive = false);

/// Fetches an access token for @p service_account.
StatusOr<AccessToken> GetServiceAccountToken(
    rest_internal::RestClient& client,
    std::chrono::system_clock::time_point now,
    std::string const& service_account = "default",
    Options const& options = {});

/**
 * Fetches the information about @p service_account.
 *
 * The result includes the `email`, `aliases` and `scopes` attributes.
 */
StatusOr<nlohmann::json> GetServiceAccountInfo(
    rest_internal::RestClient& client,
    std::string const& service_account = "default",
    Options const& options = {});

/// Fetches the project id of the current instance.
StatusOr<std::string> GetProjectId(rest_internal::RestClient& client,
                                   Options const& options = {});

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_COMPUTE_ENGINE_METADATA_H
