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

#include "cloudauth/oauth2/credentials.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include <algorithm>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

bool Credentials::expired() const {
  return expiry_.has_value() && *expiry_ <= Now();
}

bool Credentials::valid() const { return token_.has_value() && !expired(); }

Status Credentials::BeforeRequest(rest_internal::RestClient& client,
                                  std::string const& /*method*/,
                                  std::string const& /*url*/,
                                  rest_internal::HttpHeaders& headers) {
  if (!valid()) {
    auto status = Refresh(client);
    if (!status.ok()) return status;
  }
  Apply(headers);
  return Status{};
}

void Credentials::Apply(rest_internal::HttpHeaders& headers,
                        absl::optional<std::string> token) const {
  if (!token) token = token_;
  headers["authorization"] = {absl::StrCat("Bearer ", token.value_or(""))};
}

void Credentials::SetToken(
    std::string token,
    absl::optional<std::chrono::system_clock::time_point> expiry) {
  token_ = std::move(token);
  expiry_ = std::move(expiry);
}

bool Scoped::HasScopes(std::vector<std::string> const& scopes) const {
  auto const current = this->scopes().value_or(std::vector<std::string>{});
  return std::all_of(scopes.begin(), scopes.end(),
                     [&current](std::string const& s) {
                       return std::find(current.begin(), current.end(), s) !=
                              current.end();
                     });
}

bool Scoped::HasScopes(std::string const& scopes) const {
  std::vector<std::string> split =
      absl::StrSplit(scopes, ' ', absl::SkipEmpty());
  return HasScopes(split);
}

StatusOr<std::shared_ptr<Credentials>> WithScopesIfRequired(
    std::shared_ptr<Credentials> credentials, std::vector<std::string> scopes) {
  auto const* scoped = dynamic_cast<Scoped const*>(credentials.get());
  if (scoped == nullptr || !scoped->requires_scopes()) return credentials;
  return scoped->WithScopes(std::move(scopes));
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
