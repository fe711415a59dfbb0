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

#include "cloudauth/internal/rest_response.h"
#include "absl/strings/match.h"

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

bool IsHttpSuccess(RestResponse const& response) {
  static_assert(HttpStatusCode::kMinSuccess < HttpStatusCode::kMinNotSuccess,
                "Invalid HTTP code success range");
  return response.StatusCode() < HttpStatusCode::kMinNotSuccess &&
         response.StatusCode() >= HttpStatusCode::kMinSuccess;
}

absl::optional<std::string> GetResponseHeader(RestResponse const& response,
                                              std::string const& name) {
  for (auto const& kv : response.Headers()) {
    if (absl::EqualsIgnoreCase(kv.first, name)) return kv.second;
  }
  return absl::nullopt;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
