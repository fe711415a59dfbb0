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

#ifndef CLOUDAUTH_INTERNAL_REST_RESPONSE_H
#define CLOUDAUTH_INTERNAL_REST_RESPONSE_H

#include "cloudauth/internal/http_payload.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

enum HttpStatusCode : std::int32_t {
  kMinSuccess = 200,
  // libcurl follows redirects, anything at or above 300 is a failure.
  kMinNotSuccess = 300,

  kOk = 200,

  kBadRequest = 400,
  kUnauthorized = 401,
  kForbidden = 403,
  kNotFound = 404,

  kInternalServerError = 500,
  kServiceUnavailable = 503,
};

class RestResponse {
 public:
  virtual ~RestResponse() = default;
  virtual HttpStatusCode StatusCode() const = 0;
  virtual std::multimap<std::string, std::string> Headers() const = 0;
  // Creates a HttpPayload object from the underlying HTTP response,
  // invalidating the current RestResponse object.
  virtual std::unique_ptr<HttpPayload> ExtractPayload() && = 0;
};

/// True for 2xx responses.
bool IsHttpSuccess(RestResponse const& response);

/// Returns the first value of the response header @p name, ignoring case.
absl::optional<std::string> GetResponseHeader(RestResponse const& response,
                                              std::string const& name);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_REST_RESPONSE_H
