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

#include "cloudauth/oauth2/authorized_http_client.h"
#include "cloudauth/log.h"
#include "cloudauth/oauth2/options.h"

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

using ::cloudauth::rest_internal::RestContext;
using ::cloudauth::rest_internal::RestRequest;
using ::cloudauth::rest_internal::RestResponse;

AuthorizedHttpClient::AuthorizedHttpClient(
    std::shared_ptr<Credentials> credentials,
    std::shared_ptr<rest_internal::RestClient> client, Options options,
    std::shared_ptr<rest_internal::RestClient> refresh_client)
    : credentials_(std::move(credentials)),
      client_(std::move(client)),
      refresh_client_(refresh_client ? std::move(refresh_client) : client_),
      refresh_status_codes_(
          options.has<RefreshStatusCodesOption>()
              ? options.get<RefreshStatusCodesOption>()
              : std::set<int>{rest_internal::HttpStatusCode::kUnauthorized}),
      max_refresh_attempts_(options.has<MaxRefreshAttemptsOption>()
                                ? options.get<MaxRefreshAttemptsOption>()
                                : kDefaultMaxRefreshAttempts) {}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Delete(
    RestContext& context, RestRequest const& request) {
  return AuthorizedRequest(
      context, request, "DELETE",
      [this](RestContext& c, RestRequest const& r) {
        return client_->Delete(c, r);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Get(
    RestContext& context, RestRequest const& request) {
  return AuthorizedRequest(
      context, request, "GET",
      [this](RestContext& c, RestRequest const& r) {
        return client_->Get(c, r);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Patch(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return AuthorizedRequest(
      context, request, "PATCH",
      [this, &payload](RestContext& c, RestRequest const& r) {
        return client_->Patch(c, r, payload);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Post(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return AuthorizedRequest(
      context, request, "POST",
      [this, &payload](RestContext& c, RestRequest const& r) {
        return client_->Post(c, r, payload);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Post(
    RestContext& context, RestRequest const& request,
    std::vector<std::pair<std::string, std::string>> const& form_data) {
  return AuthorizedRequest(
      context, request, "POST",
      [this, &form_data](RestContext& c, RestRequest const& r) {
        return client_->Post(c, r, form_data);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::Put(
    RestContext& context, RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  return AuthorizedRequest(
      context, request, "PUT",
      [this, &payload](RestContext& c, RestRequest const& r) {
        return client_->Put(c, r, payload);
      },
      0);
}

StatusOr<std::unique_ptr<RestResponse>> AuthorizedHttpClient::AuthorizedRequest(
    RestContext& context, RestRequest const& request, std::string const& method,
    MakeRequest make_request, int attempt) {
  auto headers = request.headers();
  auto status = credentials_->BeforeRequest(*refresh_client_, method,
                                            request.path(), headers);
  if (!status.ok()) return status;

  auto response = make_request(
      context,
      RestRequest(request.path(), std::move(headers), request.parameters()));
  if (!response) return response;

  auto const status_code = static_cast<int>((*response)->StatusCode());
  if (refresh_status_codes_.count(status_code) == 0 ||
      attempt >= max_refresh_attempts_) {
    return response;
  }
  CLOUDAUTH_LOG(INFO) << "Refreshing credentials due to a " << status_code
                      << " response. Attempt " << attempt + 1 << "/"
                      << max_refresh_attempts_ << ".";
  status = credentials_->Refresh(*refresh_client_);
  if (!status.ok()) return status;
  return AuthorizedRequest(context, request, method, make_request,
                           attempt + 1);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
