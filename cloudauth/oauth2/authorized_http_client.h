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

#ifndef CLOUDAUTH_OAUTH2_AUTHORIZED_HTTP_CLIENT_H
#define CLOUDAUTH_OAUTH2_AUTHORIZED_HTTP_CLIENT_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/oauth2/credentials.h"
#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include "absl/functional/function_ref.h"
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * A `RestClient` decorator that authorizes each request.
 *
 * Before each request the credentials add the `authorization` header. If the
 * response status is in `RefreshStatusCodesOption` (by default 401) the
 * credentials are refreshed and the request is retried, at most
 * `MaxRefreshAttemptsOption` times. The caller's request is never modified.
 *
 * The credentials are not synchronized, the decorator must not be used from
 * multiple threads at the same time.
 */
class AuthorizedHttpClient : public rest_internal::RestClient {
 public:
  /**
   * Creates a decorator around @p client.
   *
   * @param refresh_client used to refresh the credentials. Defaults to
   *     @p client.
   */
  AuthorizedHttpClient(
      std::shared_ptr<Credentials> credentials,
      std::shared_ptr<rest_internal::RestClient> client, Options options = {},
      std::shared_ptr<rest_internal::RestClient> refresh_client = nullptr);
  ~AuthorizedHttpClient() override = default;

  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Delete(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request) override;
  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Get(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request) override;
  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Patch(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;
  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Post(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;
  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Post(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request,
      std::vector<std::pair<std::string, std::string>> const& form_data)
      override;
  StatusOr<std::unique_ptr<rest_internal::RestResponse>> Put(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;

  std::shared_ptr<Credentials> const& credentials() const {
    return credentials_;
  }

 private:
  using MakeRequest =
      absl::FunctionRef<StatusOr<std::unique_ptr<rest_internal::RestResponse>>(
          rest_internal::RestContext&, rest_internal::RestRequest const&)>;

  StatusOr<std::unique_ptr<rest_internal::RestResponse>> AuthorizedRequest(
      rest_internal::RestContext& context,
      rest_internal::RestRequest const& request, std::string const& method,
      MakeRequest make_request, int attempt);

  std::shared_ptr<Credentials> credentials_;
  std::shared_ptr<rest_internal::RestClient> client_;
  std::shared_ptr<rest_internal::RestClient> refresh_client_;
  std::set<int> refresh_status_codes_;
  int max_refresh_attempts_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_AUTHORIZED_HTTP_CLIENT_H
