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

#include "cloudauth/oauth2/jwt_credentials.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/oauth2/service_account_info.h"
#include <cstdint>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

JwtCredentials::JwtCredentials(std::shared_ptr<Signer const> signer,
                               JwtClaims claims, Options options,
                               CurrentTimeFn current_time_fn)
    : Credentials(std::move(current_time_fn)),
      signer_(std::move(signer)),
      claims_(std::move(claims)),
      options_(std::move(options)) {
  if (claims_.additional_claims.is_null()) {
    claims_.additional_claims = nlohmann::json::object();
  }
  // An empty audience selects the per-request tokens.
  if (claims_.audience && claims_.audience->empty()) claims_.audience.reset();
}

StatusOr<std::shared_ptr<JwtCredentials>>
JwtCredentials::FromServiceAccountInfo(nlohmann::json const& info,
                                       JwtClaims claims, Options options,
                                       CurrentTimeFn current_time_fn) {
  auto parsed = ParseServiceAccountInfo(info, "service account info");
  if (!parsed) return std::move(parsed).status();
  auto signer =
      RsaSigner::FromString(parsed->private_key, parsed->private_key_id);
  if (!signer) return std::move(signer).status();
  claims.issuer = parsed->client_email;
  if (!claims.subject) claims.subject = parsed->client_email;
  return std::make_shared<JwtCredentials>(*std::move(signer), std::move(claims),
                                          std::move(options),
                                          std::move(current_time_fn));
}

StatusOr<std::shared_ptr<JwtCredentials>>
JwtCredentials::FromServiceAccountFile(std::string const& path,
                                       JwtClaims claims, Options options,
                                       CurrentTimeFn current_time_fn) {
  auto info = LoadJsonFile(path);
  if (!info) return std::move(info).status();
  return FromServiceAccountInfo(*info, std::move(claims), std::move(options),
                                std::move(current_time_fn));
}

std::shared_ptr<JwtCredentials> JwtCredentials::WithClaims(
    JwtClaims const& claims) const {
  JwtClaims merged = claims_;
  if (claims.issuer) merged.issuer = claims.issuer;
  if (claims.subject) merged.subject = claims.subject;
  if (claims.audience) merged.audience = claims.audience;
  if (claims.additional_claims.is_object()) {
    merged.additional_claims.update(claims.additional_claims);
  }
  return std::make_shared<JwtCredentials>(signer_, std::move(merged), options_,
                                          current_time_fn());
}

Status JwtCredentials::Refresh(rest_internal::RestClient&) {
  auto jwt = MakeJwt(claims_.audience);
  if (!jwt) return std::move(jwt).status();
  SetToken(std::move(jwt->token), jwt->expiry);
  return Status{};
}

Status JwtCredentials::BeforeRequest(rest_internal::RestClient& client,
                                     std::string const& method,
                                     std::string const& url,
                                     rest_internal::HttpHeaders& headers) {
  if (claims_.audience) {
    return Credentials::BeforeRequest(client, method, url, headers);
  }
  auto jwt = MakeJwt(StripQueryAndFragment(url));
  if (!jwt) return std::move(jwt).status();
  Apply(headers, std::move(jwt->token));
  return Status{};
}

StatusOr<std::string> JwtCredentials::SignBytes(
    std::string const& message) const {
  return signer_->Sign(message);
}

StatusOr<JwtCredentials::SignedJwt> JwtCredentials::MakeJwt(
    absl::optional<std::string> const& audience) const {
  auto const lifetime = options_.has<JwtTokenLifetimeOption>()
                            ? options_.get<JwtTokenLifetimeOption>()
                            : kJwtDefaultTokenLifetime;
  auto const now = Now();
  auto const expiry = now + lifetime;
  auto to_epoch = [](std::chrono::system_clock::time_point tp) {
    return static_cast<std::intmax_t>(
        std::chrono::system_clock::to_time_t(tp));
  };

  nlohmann::json payload{{"iat", to_epoch(now)}, {"exp", to_epoch(expiry)}};
  if (claims_.issuer) payload["iss"] = *claims_.issuer;
  auto const& subject = claims_.subject ? claims_.subject : claims_.issuer;
  if (subject) payload["sub"] = *subject;
  if (audience) payload["aud"] = *audience;
  payload.update(claims_.additional_claims);

  auto token = JwtEncode(*signer_, payload);
  if (!token) return std::move(token).status();
  return SignedJwt{*std::move(token), expiry};
}

std::string StripQueryAndFragment(std::string const& url) {
  return url.substr(0, url.find_first_of("?#"));
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
