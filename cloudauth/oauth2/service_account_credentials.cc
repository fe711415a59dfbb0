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

#include "cloudauth/oauth2/service_account_credentials.h"
#include "cloudauth/oauth2/oauth2_client.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/oauth2/service_account_info.h"
#include "absl/strings/str_join.h"
#include <cstdint>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

ServiceAccountCredentials::ServiceAccountCredentials(
    std::shared_ptr<Signer const> signer, ServiceAccountCredentialsInfo info,
    Options options, CurrentTimeFn current_time_fn)
    : Credentials(std::move(current_time_fn)),
      signer_(std::move(signer)),
      info_(std::move(info)),
      options_(std::move(options)) {
  if (info_.additional_claims.is_null()) {
    info_.additional_claims = nlohmann::json::object();
  }
}

StatusOr<std::shared_ptr<ServiceAccountCredentials>>
ServiceAccountCredentials::FromServiceAccountInfo(
    nlohmann::json const& info,
    absl::optional<std::vector<std::string>> scopes,
    absl::optional<std::string> subject, Options options,
    CurrentTimeFn current_time_fn) {
  auto parsed = ParseServiceAccountInfo(info, "service account info");
  if (!parsed) return std::move(parsed).status();
  auto signer =
      RsaSigner::FromString(parsed->private_key, parsed->private_key_id);
  if (!signer) return std::move(signer).status();
  ServiceAccountCredentialsInfo sa;
  sa.service_account_email = parsed->client_email;
  sa.token_uri = parsed->token_uri;
  sa.scopes = std::move(scopes);
  sa.subject = std::move(subject);
  return std::make_shared<ServiceAccountCredentials>(
      *std::move(signer), std::move(sa), std::move(options),
      std::move(current_time_fn));
}

StatusOr<std::shared_ptr<ServiceAccountCredentials>>
ServiceAccountCredentials::FromServiceAccountFile(
    std::string const& path, absl::optional<std::vector<std::string>> scopes,
    absl::optional<std::string> subject, Options options,
    CurrentTimeFn current_time_fn) {
  auto info = LoadJsonFile(path);
  if (!info) return std::move(info).status();
  return FromServiceAccountInfo(*info, std::move(scopes), std::move(subject),
                                std::move(options),
                                std::move(current_time_fn));
}

Status ServiceAccountCredentials::Refresh(rest_internal::RestClient& client) {
  auto const now = Now();
  auto assertion = MakeAssertion(now);
  if (!assertion) return std::move(assertion).status();
  auto result = JwtGrant(client, info_.token_uri, *assertion, now);
  if (!result) return std::move(result).status();
  SetToken(std::move(result->access_token), result->expiry);
  return Status{};
}

bool ServiceAccountCredentials::requires_scopes() const {
  return !info_.scopes.has_value() || info_.scopes->empty();
}

StatusOr<std::shared_ptr<Credentials>> ServiceAccountCredentials::WithScopes(
    std::vector<std::string> scopes) const {
  auto info = info_;
  info.scopes = std::move(scopes);
  return std::shared_ptr<Credentials>(
      std::make_shared<ServiceAccountCredentials>(signer_, std::move(info),
                                                  options_, current_time_fn()));
}

std::shared_ptr<ServiceAccountCredentials>
ServiceAccountCredentials::WithSubject(std::string subject) const {
  auto info = info_;
  info.subject = std::move(subject);
  return std::make_shared<ServiceAccountCredentials>(
      signer_, std::move(info), options_, current_time_fn());
}

StatusOr<std::string> ServiceAccountCredentials::SignBytes(
    std::string const& message) const {
  return signer_->Sign(message);
}

StatusOr<std::string> ServiceAccountCredentials::MakeAssertion(
    std::chrono::system_clock::time_point now) const {
  auto const lifetime = options_.has<JwtTokenLifetimeOption>()
                            ? options_.get<JwtTokenLifetimeOption>()
                            : kJwtDefaultTokenLifetime;
  // Scopes must be specified in a space separated string.
  auto const scope = absl::StrJoin(
      info_.scopes.value_or(std::vector<std::string>{}), " ");
  auto const iat =
      static_cast<std::intmax_t>(std::chrono::system_clock::to_time_t(now));
  auto const exp = static_cast<std::intmax_t>(
      std::chrono::system_clock::to_time_t(now + lifetime));
  nlohmann::json payload{{"iss", info_.service_account_email},
                         {"aud", info_.token_uri},
                         {"iat", iat},
                         {"exp", exp},
                         {"scope", scope}};
  if (info_.subject) payload["sub"] = *info_.subject;
  payload.update(info_.additional_claims);
  return JwtEncode(*signer_, payload);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
