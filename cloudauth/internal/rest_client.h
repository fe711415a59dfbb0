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

#ifndef CLOUDAUTH_INTERNAL_REST_CLIENT_H
#define CLOUDAUTH_INTERNAL_REST_CLIENT_H

#include "cloudauth/internal/rest_context.h"
#include "cloudauth/internal/rest_options.h"
#include "cloudauth/internal/rest_request.h"
#include "cloudauth/internal/rest_response.h"
#include "cloudauth/options.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/span.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * Provides methods corresponding to HTTP verbs to make HTTP requests.
 *
 * This is the only way the credential library talks to the network: the
 * metadata server, the OAuth2 token endpoint, and the authorized transport all
 * consume a `RestClient&`. Tests use `testing_util::MockRestClient`.
 *
 * HTTP requests that complete with an HTTP error status, e.g. "401 -
 * UNAUTHORIZED", are a success at this layer: the returned `StatusOr<>` holds
 * a response. An error status means the request could not be completed
 * (connection refused, DNS failure, timeout).
 */
class RestClient {
 public:
  virtual ~RestClient() = default;
  virtual StatusOr<std::unique_ptr<RestResponse>> Delete(
      RestContext& context, RestRequest const& request) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Get(
      RestContext& context, RestRequest const& request) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Patch(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Post(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) = 0;
  /// Sends @p form_data as an `application/x-www-form-urlencoded` body.
  virtual StatusOr<std::unique_ptr<RestResponse>> Post(
      RestContext& context, RestRequest const& request,
      std::vector<std::pair<std::string, std::string>> const& form_data) = 0;
  virtual StatusOr<std::unique_ptr<RestResponse>> Put(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) = 0;
};

/// Returns the libcurl-based `RestClient`.
std::unique_ptr<RestClient> MakeDefaultRestClient(Options options);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_REST_CLIENT_H
