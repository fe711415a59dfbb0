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

#ifndef CLOUDAUTH_INTERNAL_AUTH_ERRORS_H
#define CLOUDAUTH_INTERNAL_AUTH_ERRORS_H

#include "cloudauth/internal/make_status.h"
#include "cloudauth/status.h"
#include "cloudauth/version.h"
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * @name `ErrorInfo::reason()` values for credential errors.
 *
 * Each failure class maps to a fixed `StatusCode` and one of these reasons,
 * so callers can tell a rejected grant from a malformed key file even when
 * both are reported with the same code.
 */
///@{
auto constexpr kParseErrorReason = "PARSE_ERROR";
auto constexpr kInvalidCredentialTypeReason = "INVALID_CREDENTIAL_TYPE";
auto constexpr kVerificationErrorReason = "VERIFICATION_FAILED";
auto constexpr kRefreshErrorReason = "REFRESH_FAILED";
auto constexpr kTransportErrorReason = "TRANSPORT_ERROR";
auto constexpr kDiscoveryErrorReason = "NO_CREDENTIALS_FOUND";
auto constexpr kUnsupportedOperationReason = "UNSUPPORTED_OPERATION";
///@}

/// Malformed JSON, JWT segments, or credential files.
Status ParseError(std::string msg, ErrorInfoBuilder b);

/// The credential file `type` field is missing or unrecognized.
Status InvalidCredentialTypeError(std::string msg, ErrorInfoBuilder b);

/// JWT signature, timestamp, key id, or audience checks failed.
Status VerificationError(std::string msg, ErrorInfoBuilder b);

/// A token endpoint or the metadata server did not produce a token.
Status RefreshError(std::string msg, ErrorInfoBuilder b);

/// The HTTP request could not be completed, or returned an error status.
Status TransportError(std::string msg, ErrorInfoBuilder b);

/// The default resolution chain found no credentials.
Status DiscoveryError(std::string msg, ErrorInfoBuilder b);

/// The credential type does not support the requested operation.
Status UnsupportedOperationError(std::string msg, ErrorInfoBuilder b);

/**
 * Reports @p status as a refresh failure.
 *
 * Transport errors keep their code (so `kUnavailable` is still retryable by
 * the caller) but their reason becomes `REFRESH_FAILED`. The original reason
 * is preserved in the metadata.
 */
Status AsRefreshError(Status const& status, ErrorInfoBuilder b);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_AUTH_ERRORS_H
