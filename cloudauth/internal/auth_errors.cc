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

#include "cloudauth/internal/auth_errors.h"

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

Status ParseError(std::string msg, ErrorInfoBuilder b) {
  return InvalidArgumentError(std::move(msg),
                              std::move(b).WithReason(kParseErrorReason));
}

Status InvalidCredentialTypeError(std::string msg, ErrorInfoBuilder b) {
  return InvalidArgumentError(
      std::move(msg), std::move(b).WithReason(kInvalidCredentialTypeReason));
}

Status VerificationError(std::string msg, ErrorInfoBuilder b) {
  return PermissionDeniedError(
      std::move(msg), std::move(b).WithReason(kVerificationErrorReason));
}

Status RefreshError(std::string msg, ErrorInfoBuilder b) {
  return UnauthenticatedError(std::move(msg),
                              std::move(b).WithReason(kRefreshErrorReason));
}

Status TransportError(std::string msg, ErrorInfoBuilder b) {
  return UnavailableError(std::move(msg),
                          std::move(b).WithReason(kTransportErrorReason));
}

Status DiscoveryError(std::string msg, ErrorInfoBuilder b) {
  return NotFoundError(std::move(msg),
                       std::move(b).WithReason(kDiscoveryErrorReason));
}

Status UnsupportedOperationError(std::string msg, ErrorInfoBuilder b) {
  return UnimplementedError(
      std::move(msg), std::move(b).WithReason(kUnsupportedOperationReason));
}

Status AsRefreshError(Status const& status, ErrorInfoBuilder b) {
  if (status.error_info().reason() == kRefreshErrorReason) return status;
  auto code = status.code() == StatusCode::kUnavailable ||
                      status.code() == StatusCode::kDeadlineExceeded
                  ? status.code()
                  : StatusCode::kUnauthenticated;
  auto info = std::move(b)
                  .WithReason(kRefreshErrorReason)
                  .WithMetadata("cause", status.error_info().reason())
                  .Build(code);
  return Status(code, status.message(), std::move(info));
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
