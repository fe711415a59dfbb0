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

#include "cloudauth/oauth2/compute_engine_credentials.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/oauth2/compute_engine_metadata.h"
#include "absl/strings/str_split.h"

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

// The metadata server returns scopes as an array, older versions as a string
// with one scope per line.
std::vector<std::string> ParseScopes(nlohmann::json const& scopes) {
  std::vector<std::string> result;
  if (scopes.is_string()) {
    result = absl::StrSplit(scopes.get<std::string>(), '\n',
                            absl::SkipWhitespace());
  } else if (scopes.is_array()) {
    for (auto const& s : scopes) {
      if (s.is_string()) result.push_back(s.get<std::string>());
    }
  }
  return result;
}

}  // namespace

ComputeEngineCredentials::ComputeEngineCredentials(
    std::string service_account_email, Options options,
    CurrentTimeFn current_time_fn)
    : Credentials(std::move(current_time_fn)),
      service_account_email_(std::move(service_account_email)),
      options_(std::move(options)) {}

Status ComputeEngineCredentials::Refresh(rest_internal::RestClient& client) {
  auto token =
      GetServiceAccountToken(client, Now(), service_account_email_, options_);
  if (!token) {
    return internal::AsRefreshError(std::move(token).status(),
                                    CLOUDAUTH_ERROR_INFO());
  }
  SetToken(std::move(token->token), token->expiration);
  return Status{};
}

Status ComputeEngineCredentials::RetrieveServiceAccountInfo(
    rest_internal::RestClient& client) {
  auto info = GetServiceAccountInfo(client, service_account_email_, options_);
  if (!info) return std::move(info).status();
  auto const email = info->find("email");
  if (email == info->end() || !email->is_string()) {
    return internal::TransportError(
        "Missing email in service account info from the metadata server.",
        CLOUDAUTH_ERROR_INFO());
  }
  service_account_email_ = email->get<std::string>();
  auto const scopes = info->find("scopes");
  if (scopes != info->end()) scopes_ = ParseScopes(*scopes);
  return Status{};
}

StatusOr<std::shared_ptr<Credentials>> ComputeEngineCredentials::WithScopes(
    std::vector<std::string> /*scopes*/) const {
  return internal::UnsupportedOperationError(
      "Compute Engine credentials can not modify their scopes.",
      CLOUDAUTH_ERROR_INFO());
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
