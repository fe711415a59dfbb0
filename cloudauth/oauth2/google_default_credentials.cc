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

#include "cloudauth/oauth2/google_default_credentials.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/filesystem.h"
#include "cloudauth/internal/getenv.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/log.h"
#include "cloudauth/oauth2/compute_engine_credentials.h"
#include "cloudauth/oauth2/compute_engine_metadata.h"
#include "cloudauth/oauth2/jwt_credentials.h"
#include "cloudauth/oauth2/options.h"
#include "cloudauth/oauth2/service_account_info.h"
#include "cloudauth/oauth2/user_credentials.h"
#include "absl/strings/str_cat.h"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

namespace pt = ::boost::property_tree;

auto constexpr kCredentialsEnvVar = "GOOGLE_APPLICATION_CREDENTIALS";
auto constexpr kProjectEnvVar = "GCLOUD_PROJECT";
auto constexpr kCloudSdkConfigEnvVar = "CLOUDSDK_CONFIG";
auto constexpr kCloudSdkConfigDirectory = "gcloud";
auto constexpr kCloudSdkCredentialsFile =
    "application_default_credentials.json";
auto constexpr kAuthorizedUserType = "authorized_user";
auto constexpr kServiceAccountType = "service_account";

auto constexpr kHelpMessage =
    "Could not automatically determine credentials. Please set "
    "GOOGLE_APPLICATION_CREDENTIALS or explicitly create credential and "
    "re-run the application. For more information, please see "
    "https://developers.google.com/accounts/docs/"
    "application-default-credentials.";

bool FileExists(std::string const& path) {
  std::error_code ec;
  return internal::exists(internal::status(path, ec));
}

// An empty project id is the same as no project id.
absl::optional<std::string> NonEmpty(absl::optional<std::string> value) {
  if (!value || value->empty()) return absl::nullopt;
  return value;
}

std::string ProjectIdForLog(absl::optional<std::string> const& project_id) {
  return project_id.value_or("<none>");
}

}  // namespace

StatusOr<DefaultCredentials> LoadCredentialsFromFile(std::string const& path,
                                                     Options const& options) {
  auto info = LoadJsonFile(path);
  if (!info) return std::move(info).status();

  auto const type = info->find("type");
  auto const type_name = type != info->end() && type->is_string()
                             ? type->get<std::string>()
                             : std::string("None");
  if (type_name == kAuthorizedUserType) {
    auto const token_uri = options.has<TokenUriOption>()
                               ? options.get<TokenUriOption>()
                               : std::string(kGoogleOAuthTokenUri);
    auto user = ParseAuthorizedUserInfo(*info, path, token_uri);
    if (!user) return std::move(user).status();
    return DefaultCredentials{
        std::make_shared<UserCredentials>(*std::move(user)), absl::nullopt};
  }
  if (type_name == kServiceAccountType) {
    auto parsed = ParseServiceAccountInfo(*info, path);
    if (!parsed) return std::move(parsed).status();
    auto credentials =
        JwtCredentials::FromServiceAccountInfo(*info, JwtClaims{}, options);
    if (!credentials) return std::move(credentials).status();
    return DefaultCredentials{*std::move(credentials),
                              NonEmpty(parsed->project_id)};
  }
  return internal::InvalidCredentialTypeError(
      absl::StrCat("The file ", path,
                   " does not have a valid type. Type is ", type_name,
                   ", expected one of (authorized_user, service_account)."),
      CLOUDAUTH_ERROR_INFO()
          .WithMetadata("filename", path)
          .WithMetadata("type", type_name));
}

StatusOr<absl::optional<DefaultCredentials>> GetExplicitEnvironCredentials(
    Options const& options) {
  CLOUDAUTH_LOG(DEBUG) << "Checking " << kCredentialsEnvVar
                       << " for explicit credentials as part of auth process";
  auto path = internal::GetEnv(kCredentialsEnvVar);
  if (!path.has_value()) return absl::optional<DefaultCredentials>{};
  auto credentials = LoadCredentialsFromFile(*path, options);
  if (!credentials) return std::move(credentials).status();
  return absl::make_optional(*std::move(credentials));
}

std::string GcloudSdkConfigDirectory() {
  auto config = internal::GetEnv(kCloudSdkConfigEnvVar);
  if (config.has_value()) return *std::move(config);
#ifdef _WIN32
  auto appdata = internal::GetEnv("APPDATA");
  if (appdata.has_value()) {
    return internal::PathAppend(*appdata, kCloudSdkConfigDirectory);
  }
  auto drive = internal::GetEnv("SystemDrive").value_or("C:");
  return internal::PathAppend(drive + "\\", kCloudSdkConfigDirectory);
#else
  auto home = internal::GetEnv("HOME").value_or("");
  return internal::PathAppend(internal::PathAppend(home, ".config"),
                              kCloudSdkConfigDirectory);
#endif  // _WIN32
}

absl::optional<std::string> GetGcloudSdkProjectId(
    std::string const& config_dir) {
  auto const path = internal::PathAppend(
      internal::PathAppend(config_dir, "configurations"), "config_default");
  if (!FileExists(path)) return absl::nullopt;
  pt::ptree config;
  try {
    pt::ini_parser::read_ini(path, config);
  } catch (pt::ini_parser_error const& ex) {
    CLOUDAUTH_LOG(DEBUG) << "Cannot parse Cloud SDK configuration: "
                         << ex.what();
    return absl::nullopt;
  }
  auto project = config.get_optional<std::string>("core.project");
  if (!project) return absl::nullopt;
  return NonEmpty(*std::move(project));
}

StatusOr<absl::optional<DefaultCredentials>> GetGcloudSdkCredentials(
    Options const& options) {
  CLOUDAUTH_LOG(DEBUG) << "Checking Cloud SDK credentials as part of auth"
                       << " process";
  auto const config_dir = GcloudSdkConfigDirectory();
  auto const path =
      internal::PathAppend(config_dir, kCloudSdkCredentialsFile);
  if (!FileExists(path)) {
    CLOUDAUTH_LOG(DEBUG) << "Cloud SDK credentials not found on filesystem";
    return absl::optional<DefaultCredentials>{};
  }
  auto credentials = LoadCredentialsFromFile(path, options);
  if (!credentials) return std::move(credentials).status();
  if (!credentials->project_id.has_value()) {
    credentials->project_id = GetGcloudSdkProjectId(config_dir);
  }
  return absl::make_optional(*std::move(credentials));
}

StatusOr<absl::optional<DefaultCredentials>> GetAppEngineCredentials() {
  CLOUDAUTH_LOG(DEBUG) << "App Engine standard credentials are not supported";
  return absl::optional<DefaultCredentials>{};
}

StatusOr<absl::optional<DefaultCredentials>> GetComputeEngineCredentials(
    rest_internal::RestClient& client, Options const& options) {
  CLOUDAUTH_LOG(DEBUG) << "Checking for Compute Engine metadata server";
  if (!Ping(client, options)) {
    CLOUDAUTH_LOG(DEBUG) << "Compute Engine metadata server not available";
    return absl::optional<DefaultCredentials>{};
  }
  DefaultCredentials result{
      std::make_shared<ComputeEngineCredentials>("default", options),
      absl::nullopt};
  auto project_id = GetProjectId(client, options);
  if (project_id) {
    result.project_id = NonEmpty(*std::move(project_id));
  } else {
    CLOUDAUTH_LOG(WARNING) << "Failed to retrieve the project id from the"
                           << " Compute Engine metadata server: "
                           << project_id.status();
  }
  return absl::make_optional(std::move(result));
}

StatusOr<DefaultCredentials> GoogleDefaultCredentials(
    Options const& options, HttpClientFactory client_factory) {
  if (!client_factory) {
    client_factory = [](Options const& o) {
      return rest_internal::MakeDefaultRestClient(o);
    };
  }
  auto const explicit_project_id = NonEmpty(internal::GetEnv(kProjectEnvVar));
  auto with_project =
      [&](DefaultCredentials c) -> StatusOr<DefaultCredentials> {
    if (explicit_project_id.has_value()) c.project_id = explicit_project_id;
    CLOUDAUTH_LOG(DEBUG) << "Found default credentials, project id: "
                         << ProjectIdForLog(c.project_id);
    return c;
  };

  auto explicit_credentials = GetExplicitEnvironCredentials(options);
  if (!explicit_credentials) return std::move(explicit_credentials).status();
  if (explicit_credentials->has_value()) {
    return with_project(**std::move(explicit_credentials));
  }

  auto sdk = GetGcloudSdkCredentials(options);
  if (!sdk) return std::move(sdk).status();
  if (sdk->has_value()) return with_project(**std::move(sdk));

  auto app_engine = GetAppEngineCredentials();
  if (!app_engine) return std::move(app_engine).status();
  if (app_engine->has_value()) return with_project(**std::move(app_engine));

  auto client = client_factory(options);
  auto gce = GetComputeEngineCredentials(*client, options);
  if (!gce) return std::move(gce).status();
  if (gce->has_value()) return with_project(**std::move(gce));

  return internal::DiscoveryError(kHelpMessage, CLOUDAUTH_ERROR_INFO());
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
