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

#ifndef CLOUDAUTH_INTERNAL_REST_REQUEST_H
#define CLOUDAUTH_INTERNAL_REST_REQUEST_H

#include "cloudauth/version.h"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// HTTP headers, keyed by lowercase header name.
using HttpHeaders = std::unordered_map<std::string, std::vector<std::string>>;

/**
 * The URL, headers and query parameters of an HTTP request.
 *
 * `path()` is the full URL, e.g.
 * `http://metadata.google.internal/computeMetadata/v1/project/project-id`,
 * the `RestClient` implementations are not bound to any endpoint. Header
 * names are stored lowercase, repeated headers keep every value in order.
 */
class RestRequest {
 public:
  using HttpParameters = std::vector<std::pair<std::string, std::string>>;

  explicit RestRequest(std::string path, HttpHeaders headers = {},
                       HttpParameters parameters = {});

  std::string const& path() const { return path_; }
  HttpHeaders const& headers() const { return headers_; }
  HttpParameters const& parameters() const { return parameters_; }

  RestRequest& AddHeader(std::string header, std::string value) &;
  RestRequest&& AddHeader(std::string header, std::string value) && {
    return std::move(AddHeader(std::move(header), std::move(value)));
  }

  RestRequest& AddQueryParameter(std::string parameter, std::string value) &;
  RestRequest&& AddQueryParameter(std::string parameter, std::string value) && {
    return std::move(AddQueryParameter(std::move(parameter), std::move(value)));
  }

  /// The values of @p header, matched case-insensitively. Empty if missing.
  std::vector<std::string> GetHeader(std::string const& header) const;

  friend bool operator==(RestRequest const& lhs, RestRequest const& rhs) {
    return lhs.path_ == rhs.path_ && lhs.headers_ == rhs.headers_ &&
           lhs.parameters_ == rhs.parameters_;
  }
  friend bool operator!=(RestRequest const& lhs, RestRequest const& rhs) {
    return !(lhs == rhs);
  }

 private:
  std::string path_;
  HttpHeaders headers_;
  HttpParameters parameters_;
};

/// Lowercases an HTTP header name.
std::string NormalizeHeaderName(std::string header);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_REST_REQUEST_H
