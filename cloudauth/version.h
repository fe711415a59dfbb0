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

#ifndef CLOUDAUTH_VERSION_H
#define CLOUDAUTH_VERSION_H

#include "cloudauth/internal/version_info.h"
#include <string>

#define CLOUDAUTH_VCONCAT(Ma, Mi, Pa) v##Ma##_##Mi##_##Pa
#define CLOUDAUTH_VEVAL(Ma, Mi, Pa) CLOUDAUTH_VCONCAT(Ma, Mi, Pa)
#define CLOUDAUTH_NS                                               \
  CLOUDAUTH_VEVAL(CLOUDAUTH_VERSION_MAJOR, CLOUDAUTH_VERSION_MINOR, \
                  CLOUDAUTH_VERSION_PATCH)

/**
 * Versioned inline namespace that users should generally avoid spelling.
 *
 * The actual inline namespace name will change with each release. Omitting
 * the inline namespace name makes upgrading to newer releases easier, while
 * the versioned symbols still allow an application to link two versions of
 * the library.
 */
#define CLOUDAUTH_INLINE_NAMESPACE_BEGIN inline namespace CLOUDAUTH_NS {
#define CLOUDAUTH_INLINE_NAMESPACE_END } /* namespace CLOUDAUTH_NS */

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * The cloudauth major version.
 *
 * @see https://semver.org/spec/v2.0.0.html for details.
 */
int constexpr version_major() { return CLOUDAUTH_VERSION_MAJOR; }

/**
 * The cloudauth minor version.
 *
 * @see https://semver.org/spec/v2.0.0.html for details.
 */
int constexpr version_minor() { return CLOUDAUTH_VERSION_MINOR; }

/**
 * The cloudauth patch version.
 *
 * @see https://semver.org/spec/v2.0.0.html for details.
 */
int constexpr version_patch() { return CLOUDAUTH_VERSION_PATCH; }

/// The pre-release version, empty for regular releases.
constexpr char const* version_pre_release() { return CLOUDAUTH_PRE_RELEASE; }

namespace internal {
auto constexpr kMaxMinorVersions = 100;
auto constexpr kMaxPatchVersions = 100;
}  // namespace internal

/// A single integer representing the Major/Minor/Patch version.
int constexpr version() {
  static_assert(version_minor() < internal::kMaxMinorVersions,
                "version_minor() should be < kMaxMinorVersions");
  static_assert(version_patch() < internal::kMaxPatchVersions,
                "version_patch() should be < kMaxPatchVersions");
  return internal::kMaxPatchVersions *
             (internal::kMaxMinorVersions * version_major() + version_minor()) +
         version_patch();
}

/// The version as a string, in MAJOR.MINOR.PATCH[-PRE] format.
std::string version_string();

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_VERSION_H
