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

#ifndef CLOUDAUTH_OAUTH2_ERRORS_H
#define CLOUDAUTH_OAUTH2_ERRORS_H

#include "cloudauth/status.h"
#include "cloudauth/version.h"

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * @name Classify errors returned by the credential library.
 *
 * Every error carries an `ErrorInfo` with the domain `cloudauth` and a reason
 * naming its class. These predicates look at the reason, not the status code.
 */
///@{
bool IsParseError(Status const& status);
bool IsInvalidCredentialTypeError(Status const& status);
bool IsVerificationError(Status const& status);
bool IsRefreshError(Status const& status);
bool IsTransportError(Status const& status);
bool IsDiscoveryError(Status const& status);
bool IsUnsupportedOperationError(Status const& status);
///@}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_ERRORS_H
