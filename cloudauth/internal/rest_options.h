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

#ifndef CLOUDAUTH_INTERNAL_REST_OPTIONS_H
#define CLOUDAUTH_INTERNAL_REST_OPTIONS_H

#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include <chrono>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * The total time allowed for a single HTTP request.
 *
 * Passed to the transport through `RestContext::options()`. A zero (or unset)
 * value means no timeout. The metadata server ping sets this to
 * `oauth2::MetadataPingTimeoutOption`.
 */
struct TransferTimeoutOption {
  using Type = std::chrono::milliseconds;
};

/// The value for the `user-agent` header sent by the default transport.
struct UserAgentOption {
  using Type = std::string;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_REST_OPTIONS_H
