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

#ifndef CLOUDAUTH_OAUTH2_ACCESS_TOKEN_H
#define CLOUDAUTH_OAUTH2_ACCESS_TOKEN_H

#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <chrono>
#include <string>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// A bearer token and its expiration time, if the issuer reported one.
struct AccessToken {
  std::string token;
  absl::optional<std::chrono::system_clock::time_point> expiration;
};

inline bool operator==(AccessToken const& lhs, AccessToken const& rhs) {
  return lhs.token == rhs.token && lhs.expiration == rhs.expiration;
}

inline bool operator!=(AccessToken const& lhs, AccessToken const& rhs) {
  return !(lhs == rhs);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_ACCESS_TOKEN_H
