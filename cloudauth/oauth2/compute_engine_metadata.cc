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

#include "cloudauth/oauth2/compute_engine_metadata.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/getenv.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/log.h"
#include "cloudauth/oauth2/options.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include <cstdint>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

auto constexpr kDefaultMetadataHost = "metadata.google.internal";
auto constexpr kMetadataFlavorHeader = "metadata-flavor";
auto constexpr kMetadataFlavor = "Google";

rest_internal::RestRequest MetadataRequest(std::string url) {
  return rest_internal::RestRequest(std::move(url))
      .AddHeader(kMetadataFlavorHeader, kMetadataFlavor);
}

}  // namespace

std::string MetadataHost(Options const& options) {
  if (options.has<MetadataHostOption>()) {
    return options.get<MetadataHostOption>();
  }
  auto env = internal::GetEnv("GCE_METADATA_HOST");
  if (env.has_value() && !env->empty()) return *std::move(env);
  return kDefaultMetadataHost;
}

std::string MetadataRootUrl(Options const& options) {
  return absl::StrCat("http://", MetadataHost(options), "/computeMetadata/v1/");
}

std::string MetadataPingUrl(Options const& options) {
  return absl::StrCat("http://", MetadataHost(options), "/");
}

bool Ping(rest_internal::RestClient& client, Options const& options) {
  auto const timeout =
      options.has<MetadataPingTimeoutOption>()
          ? options.get<MetadataPingTimeoutOption>()
          : std::chrono::milliseconds(kDefaultMetadataPingTimeout);
  rest_internal::RestContext context(
      Options{}.set<rest_internal::TransferTimeoutOption>(timeout));
  auto response =
      client.Get(context, MetadataRequest(MetadataPingUrl(options)));
  if (!response) {
    CLOUDAUTH_LOG(DEBUG) << "Compute Engine metadata server unavailable: "
                         << response.status();
    return false;
  }
  if (!rest_internal::IsHttpSuccess(**response)) return false;
  auto flavor =
      rest_internal::GetResponseHeader(**response, kMetadataFlavorHeader);
  return !flavor.has_value() || *flavor == kMetadataFlavor;
}

StatusOr<MetadataValue> Get(rest_internal::RestClient& client,
                            std::string const& path, Options const& options,
                            bool recursive) {
  auto const url = MetadataRootUrl(options) + path;
  auto request = MetadataRequest(url);
  if (recursive) request.AddQueryParameter("recursive", "true");

  rest_internal::RestContext context(options);
  auto response = client.Get(context, request);
  if (!response) {
    return internal::TransportError(
        absl::StrCat("Failed to retrieve ", url,
                     " from the Google Compute Engine metadata service: ",
                     response.status().message()),
        CLOUDAUTH_ERROR_INFO().WithMetadata("path", path));
  }
  auto const status_code = (*response)->StatusCode();
  auto const content_type =
      rest_internal::GetResponseHeader(**response, "content-type");
  auto payload = rest_internal::ReadAll(std::move(**response).ExtractPayload());
  if (!payload) return std::move(payload).status();
  if (status_code < rest_internal::HttpStatusCode::kMinSuccess ||
      status_code >= rest_internal::HttpStatusCode::kMinNotSuccess) {
    return internal::TransportError(
        absl::StrCat("Failed to retrieve ", url,
                     " from the Google Compute Engine metadata service."
                     " Status: ",
                     status_code, " Response:\n", *payload),
        CLOUDAUTH_ERROR_INFO()
            .WithMetadata("path", path)
            .WithMetadata("http_status_code", std::to_string(status_code)));
  }

  if (content_type.has_value() &&
      absl::StrContains(*content_type, "application/json")) {
    auto json = nlohmann::json::parse(*payload, nullptr, false);
    if (json.is_discarded()) {
      return internal::TransportError(
          absl::StrCat("Received invalid JSON from the Google Compute Engine",
                       " metadata service: ", *payload),
          CLOUDAUTH_ERROR_INFO().WithMetadata("path", path));
    }
    return MetadataValue(*std::move(payload), std::move(json), true);
  }
  return MetadataValue(*std::move(payload));
}

StatusOr<AccessToken> GetServiceAccountToken(
    rest_internal::RestClient& client,
    std::chrono::system_clock::time_point now,
    std::string const& service_account, Options const& options) {
  auto value = Get(
      client, absl::StrCat("instance/service-accounts/", service_account,
                           "/token"),
      options);
  if (!value) return std::move(value).status();
  auto const& json = value->json();
  if (!json.is_object() || !json.contains("access_token") ||
      !json["access_token"].is_string()) {
    return internal::RefreshError(
        absl::StrCat("No access token in the metadata server response: ",
                     value->text()),
        CLOUDAUTH_ERROR_INFO());
  }
  AccessToken token{json["access_token"].get<std::string>(), absl::nullopt};
  auto const expires_in = json.find("expires_in");
  if (expires_in != json.end() && expires_in->is_number()) {
    token.expiration =
        now + std::chrono::seconds(expires_in->get<std::int64_t>());
  }
  return token;
}

StatusOr<nlohmann::json> GetServiceAccountInfo(
    rest_internal::RestClient& client, std::string const& service_account,
    Options const& options) {
  auto value = Get(client,
                   absl::StrCat("instance/service-accounts/", service_account,
                                "/"),
                   options, /*recursive=*/true);
  if (!value) return std::move(value).status();
  if (!value->is_json()) {
    return internal::TransportError(
        absl::StrCat("Expected JSON service account info, got: ",
                     value->text()),
        CLOUDAUTH_ERROR_INFO());
  }
  return value->json();
}

StatusOr<std::string> GetProjectId(rest_internal::RestClient& client,
                                   Options const& options) {
  auto value = Get(client, "project/project-id", options);
  if (!value) return std::move(value).status();
  return value->text();
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
