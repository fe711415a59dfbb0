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

#ifndef CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_INFO_H
#define CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_INFO_H

#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <nlohmann/json.hpp>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// The fields of a `service_account` key file used by the credentials.
struct ServiceAccountInfo {
  std::string client_email;
  std::string private_key;
  std::string private_key_id;
  std::string token_uri;
  absl::optional<std::string> project_id;
};

/**
 * Reads @p path and parses it as JSON.
 *
 * Returns a `PARSE_ERROR` naming the file if it cannot be read or is not
 * valid JSON.
 */
StatusOr<nlohmann::json> LoadJsonFile(std::string const& path);

/**
 * Extracts the service account fields from @p info.
 *
 * `client_email`, `private_key_id` and `private_key` are required. A missing
 * `token_uri` defaults to `kGoogleOAuthTokenUri`.
 *
 * @param source describes where @p info came from, used in error messages.
 */
StatusOr<ServiceAccountInfo> ParseServiceAccountInfo(
    nlohmann::json const& info, std::string const& source);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_SERVICE_ACCOUNT_INFO_H
