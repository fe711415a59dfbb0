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

#ifndef CLOUDAUTH_INTERNAL_FILESYSTEM_H
#define CLOUDAUTH_INTERNAL_FILESYSTEM_H

#include "cloudauth/version.h"
#include <string>
#include <system_error>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * The subset of `std::filesystem` needed to locate credential files.
 *
 * The library targets C++14, where `<filesystem>` is not available.
 */
enum class file_type {
  none = 0,   // NOLINT(readability-identifier-naming)
  not_found,  // NOLINT(readability-identifier-naming)
  regular,    // NOLINT(readability-identifier-naming)
  directory,  // NOLINT(readability-identifier-naming)
  unknown,    // NOLINT(readability-identifier-naming)
};

class file_status {  // NOLINT(readability-identifier-naming)
 public:
  file_status() noexcept : file_status(file_type::none) {}
  explicit file_status(file_type type) : type_(type) {}

  file_type type() const noexcept { return type_; }

 private:
  file_type type_;
};

/// Returns the status of @p path, a missing file is not an error.
file_status status(std::string const& path, std::error_code& ec) noexcept;

inline bool status_known(file_status s) noexcept {
  return s.type() != file_type::none;
}

inline bool exists(file_status s) noexcept {
  return status_known(s) && s.type() != file_type::not_found;
}

/// Joins @p directory and @p path with exactly one separator.
std::string PathAppend(std::string const& directory, std::string const& path);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_FILESYSTEM_H
