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

#include "cloudauth/oauth2/errors.h"
#include "cloudauth/internal/auth_errors.h"

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {
bool HasReason(Status const& status, char const* reason) {
  return !status.ok() && status.error_info().domain() == "cloudauth" &&
         status.error_info().reason() == reason;
}
}  // namespace

bool IsParseError(Status const& status) {
  return HasReason(status, internal::kParseErrorReason);
}

bool IsInvalidCredentialTypeError(Status const& status) {
  return HasReason(status, internal::kInvalidCredentialTypeReason);
}

bool IsVerificationError(Status const& status) {
  return HasReason(status, internal::kVerificationErrorReason);
}

bool IsRefreshError(Status const& status) {
  return HasReason(status, internal::kRefreshErrorReason);
}

bool IsTransportError(Status const& status) {
  return HasReason(status, internal::kTransportErrorReason);
}

bool IsDiscoveryError(Status const& status) {
  return HasReason(status, internal::kDiscoveryErrorReason);
}

bool IsUnsupportedOperationError(Status const& status) {
  return HasReason(status, internal::kUnsupportedOperationReason);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
