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

#include "cloudauth/internal/make_status.h"
#include "cloudauth/version.h"

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {
Status MakeStatus(StatusCode code, std::string msg, ErrorInfoBuilder b) {
  auto info = std::move(b).Build(code);
  return Status(code, std::move(msg), std::move(info));
}
}  // namespace

ErrorInfoBuilder::ErrorInfoBuilder(std::string file, int line,
                                   std::string function) {
  metadata_.emplace("cloudauth.version", version_string());
  metadata_.emplace("cloudauth.source.filename", std::move(file));
  metadata_.emplace("cloudauth.source.line", std::to_string(line));
  metadata_.emplace("cloudauth.source.function", std::move(function));
}

ErrorInfo ErrorInfoBuilder::Build(StatusCode code) && {
  return ErrorInfo(reason_.value_or(StatusCodeToString(code)), "cloudauth",
                   std::move(metadata_));
}

Status UnknownError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnknown, std::move(msg), std::move(b));
}

Status InvalidArgumentError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kInvalidArgument, std::move(msg),
                    std::move(b));
}

Status DeadlineExceededError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kDeadlineExceeded, std::move(msg),
                    std::move(b));
}

Status NotFoundError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kNotFound, std::move(msg), std::move(b));
}

Status PermissionDeniedError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kPermissionDenied, std::move(msg),
                    std::move(b));
}

Status UnauthenticatedError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnauthenticated, std::move(msg),
                    std::move(b));
}

Status UnimplementedError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnimplemented, std::move(msg), std::move(b));
}

Status InternalError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kInternal, std::move(msg), std::move(b));
}

Status UnavailableError(std::string msg, ErrorInfoBuilder b) {
  return MakeStatus(StatusCode::kUnavailable, std::move(msg), std::move(b));
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
