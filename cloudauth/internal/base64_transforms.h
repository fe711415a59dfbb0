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

#ifndef CLOUDAUTH_INTERNAL_BASE64_TRANSFORMS_H
#define CLOUDAUTH_INTERNAL_BASE64_TRANSFORMS_H

#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/strings/string_view.h"
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Encodes @p bytes using the URL-safe base64 alphabet (RFC 4648 section 5).
 *
 * The output has no `=` padding, as required for JWT segments.
 */
std::string UrlsafeBase64Encode(absl::string_view bytes);

/**
 * Decodes a URL-safe base64 string.
 *
 * Trailing `=` padding is optional. Characters outside the URL-safe alphabet,
 * or a length that cannot be produced by the encoder, are reported as
 * `kInvalidArgument` errors.
 */
StatusOr<std::string> UrlsafeBase64Decode(absl::string_view str);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_BASE64_TRANSFORMS_H
