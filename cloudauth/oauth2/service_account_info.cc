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

#include "cloudauth/oauth2/service_account_info.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/oauth2/options.h"
#include "absl/strings/str_cat.h"
#include <fstream>
#include <iterator>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

StatusOr<nlohmann::json> LoadJsonFile(std::string const& path) {
  std::ifstream is(path);
  if (!is.is_open()) {
    return internal::ParseError(
        absl::StrCat("Cannot open credentials file ", path),
        CLOUDAUTH_ERROR_INFO().WithMetadata("filename", path));
  }
  std::string contents(std::istreambuf_iterator<char>{is}, {});
  auto json = nlohmann::json::parse(contents, nullptr, false);
  if (json.is_discarded()) {
    return internal::ParseError(
        absl::StrCat("File ", path, " is not a valid json file."),
        CLOUDAUTH_ERROR_INFO().WithMetadata("filename", path));
  }
  return json;
}

StatusOr<ServiceAccountInfo> ParseServiceAccountInfo(
    nlohmann::json const& info, std::string const& source) {
  if (!info.is_object()) {
    return internal::ParseError(
        absl::StrCat("Invalid service account info, expected a JSON object",
                     " in data loaded from ", source),
        CLOUDAUTH_ERROR_INFO());
  }
  auto string_field =
      [&](char const* name) -> StatusOr<absl::optional<std::string>> {
    auto const i = info.find(name);
    if (i == info.end()) return absl::optional<std::string>{};
    if (!i->is_string()) {
      return internal::ParseError(
          absl::StrCat("Invalid service account info, the ", name,
                       " field is not a string in data loaded from ", source),
          CLOUDAUTH_ERROR_INFO().WithMetadata("field", name));
    }
    return absl::make_optional(i->get<std::string>());
  };
  auto required_field = [&](char const* name) -> StatusOr<std::string> {
    auto value = string_field(name);
    if (!value) return std::move(value).status();
    if (!value->has_value() || (*value)->empty()) {
      return internal::ParseError(
          absl::StrCat("Invalid service account info, the ", name,
                       " field is missing in data loaded from ", source),
          CLOUDAUTH_ERROR_INFO().WithMetadata("field", name));
    }
    return **std::move(value);
  };

  ServiceAccountInfo result;
  auto email = required_field("client_email");
  if (!email) return std::move(email).status();
  result.client_email = *std::move(email);
  auto key = required_field("private_key");
  if (!key) return std::move(key).status();
  result.private_key = *std::move(key);
  auto key_id = required_field("private_key_id");
  if (!key_id) return std::move(key_id).status();
  result.private_key_id = *std::move(key_id);
  auto token_uri = string_field("token_uri");
  if (!token_uri) return std::move(token_uri).status();
  result.token_uri = token_uri->value_or(kGoogleOAuthTokenUri);
  auto project_id = string_field("project_id");
  if (!project_id) return std::move(project_id).status();
  result.project_id = *std::move(project_id);
  return result;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
