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

#ifndef CLOUDAUTH_INTERNAL_MAKE_STATUS_H
#define CLOUDAUTH_INTERNAL_MAKE_STATUS_H

#include "cloudauth/status.h"
#include "cloudauth/version.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include <string>
#include <unordered_map>
#include <utility>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Build `ErrorInfo` instances from parts.
 *
 * This is typically used in conjunction with the `CLOUDAUTH_ERROR_INFO()`
 * macro:
 *
 * @code
 * StatusOr<std::string> GetString(nlohmann::json const& json,
 *                                 std::string const& key) {
 *   auto i = json.find(key);
 *   if (i == json.end()) {
 *     return InvalidArgumentError(
 *         "missing key", CLOUDAUTH_ERROR_INFO().WithMetadata("key", key));
 *   }
 *   return i->get<std::string>();
 * }
 * @endcode
 */
class ErrorInfoBuilder {
 public:
  ErrorInfoBuilder(std::string file, int line, std::string function);

  /// Add a metadata pair, existing values are not replaced.
  ErrorInfoBuilder&& WithMetadata(absl::string_view key,
                                  absl::string_view value) && {
    metadata_.emplace(std::string(key), std::string(value));
    return std::move(*this);
  }

  ErrorInfoBuilder&& WithReason(std::string reason) && {
    reason_ = std::move(reason);
    return std::move(*this);
  }

  /// The reason defaults to the status code name, the domain is `cloudauth`.
  ErrorInfo Build(StatusCode code) &&;

 private:
  absl::optional<std::string> reason_;
  std::unordered_map<std::string, std::string> metadata_;
};

#define CLOUDAUTH_ERROR_INFO() \
  ::cloudauth::internal::ErrorInfoBuilder(__FILE__, __LINE__, __func__)

Status UnknownError(std::string msg, ErrorInfoBuilder b);
Status InvalidArgumentError(std::string msg, ErrorInfoBuilder b);
Status DeadlineExceededError(std::string msg, ErrorInfoBuilder b);
Status NotFoundError(std::string msg, ErrorInfoBuilder b);
Status PermissionDeniedError(std::string msg, ErrorInfoBuilder b);
Status UnauthenticatedError(std::string msg, ErrorInfoBuilder b);
Status UnimplementedError(std::string msg, ErrorInfoBuilder b);
Status InternalError(std::string msg, ErrorInfoBuilder b);
Status UnavailableError(std::string msg, ErrorInfoBuilder b);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_MAKE_STATUS_H
