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

#include "cloudauth/oauth2/user_credentials.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/oauth2/oauth2_client.h"
#include "absl/strings/str_cat.h"

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

StatusOr<UserCredentialsInfo> ParseAuthorizedUserInfo(
    nlohmann::json const& info, std::string const& source,
    std::string const& token_uri) {
  UserCredentialsInfo result;
  result.token_uri = token_uri;
  struct Field {
    char const* name;
    std::string* value;
  };
  for (auto const& f : {Field{"refresh_token", &result.refresh_token},
                        Field{"client_id", &result.client_id},
                        Field{"client_secret", &result.client_secret}}) {
    auto const i = info.find(f.name);
    if (i == info.end() || !i->is_string()) {
      return internal::ParseError(
          absl::StrCat("Invalid authorized user credentials, the ", f.name,
                       " field is missing or not a string in data loaded"
                       " from ",
                       source),
          CLOUDAUTH_ERROR_INFO().WithMetadata("field", f.name));
    }
    *f.value = i->get<std::string>();
  }
  return result;
}

UserCredentials::UserCredentials(UserCredentialsInfo info,
                                 CurrentTimeFn current_time_fn)
    : Credentials(std::move(current_time_fn)), info_(std::move(info)) {
  if (info_.token) SetToken(*info_.token, absl::nullopt);
}

Status UserCredentials::Refresh(rest_internal::RestClient& client) {
  if (info_.refresh_token.empty() || info_.token_uri.empty() ||
      info_.client_id.empty() || info_.client_secret.empty()) {
    return internal::RefreshError(
        "The credentials do not contain the necessary fields need to refresh"
        " the access token. You must specify refresh_token, token_uri,"
        " client_id, and client_secret.",
        CLOUDAUTH_ERROR_INFO());
  }
  auto result = RefreshGrant(client, info_.token_uri, info_.refresh_token,
                             info_.client_id, info_.client_secret, Now());
  if (!result) return std::move(result).status();
  SetToken(std::move(result->access_token), result->expiry);
  info_.refresh_token = std::move(result->refresh_token);
  return Status{};
}

StatusOr<std::shared_ptr<Credentials>> UserCredentials::WithScopes(
    std::vector<std::string> /*scopes*/) const {
  return internal::UnsupportedOperationError(
      "OAuth 2.0 Credentials can not modify their scopes.",
      CLOUDAUTH_ERROR_INFO());
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
