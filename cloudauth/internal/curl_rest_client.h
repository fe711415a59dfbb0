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

#ifndef CLOUDAUTH_INTERNAL_CURL_REST_CLIENT_H
#define CLOUDAUTH_INTERNAL_CURL_REST_CLIENT_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/internal/rest_request.h"
#include "cloudauth/internal/rest_response.h"
#include "cloudauth/options.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// A response fully received by `CurlRestClient`.
class CurlRestResponse : public RestResponse {
 public:
  CurlRestResponse(HttpStatusCode status_code,
                   std::multimap<std::string, std::string> headers,
                   std::string payload)
      : status_code_(status_code),
        headers_(std::move(headers)),
        payload_(std::move(payload)) {}

  HttpStatusCode StatusCode() const override { return status_code_; }
  std::multimap<std::string, std::string> Headers() const override {
    return headers_;
  }
  std::unique_ptr<HttpPayload> ExtractPayload() && override;

 private:
  HttpStatusCode status_code_;
  std::multimap<std::string, std::string> headers_;
  std::string payload_;
};

/**
 * Implements `RestClient` with a libcurl easy handle per request.
 *
 * Credential traffic is small (a metadata ping, a token grant), so responses
 * are buffered in memory. The per-call `TransferTimeoutOption` from the
 * `RestContext` takes precedence over the one given at construction.
 */
class CurlRestClient : public RestClient {
 public:
  explicit CurlRestClient(Options options);
  ~CurlRestClient() override = default;

  CurlRestClient(CurlRestClient const&) = delete;
  CurlRestClient& operator=(CurlRestClient const&) = delete;

  StatusOr<std::unique_ptr<RestResponse>> Delete(
      RestContext& context, RestRequest const& request) override;
  StatusOr<std::unique_ptr<RestResponse>> Get(
      RestContext& context, RestRequest const& request) override;
  StatusOr<std::unique_ptr<RestResponse>> Patch(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;
  StatusOr<std::unique_ptr<RestResponse>> Post(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;
  StatusOr<std::unique_ptr<RestResponse>> Post(
      RestContext& context, RestRequest const& request,
      std::vector<std::pair<std::string, std::string>> const& form_data)
      override;
  StatusOr<std::unique_ptr<RestResponse>> Put(
      RestContext& context, RestRequest const& request,
      std::vector<absl::Span<char const>> const& payload) override;

 private:
  StatusOr<std::unique_ptr<RestResponse>> MakeRequest(
      char const* method, RestContext& context, RestRequest const& request,
      absl::optional<std::string> payload);

  Options options_;
};

/// Concatenates @p payload into a single request body.
std::string FlattenPayload(std::vector<absl::Span<char const>> const& payload);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_CURL_REST_CLIENT_H
