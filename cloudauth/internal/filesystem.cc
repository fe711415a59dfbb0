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

#include "cloudauth/internal/filesystem.h"
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

#if _WIN32
using os_stat_type = struct ::_stat64;
int os_stat(std::string const& path, os_stat_type& s) {
  return ::_stat64(path.c_str(), &s);
}
bool IsRegular(os_stat_type const& s) { return (s.st_mode & _S_IFREG) != 0; }
bool IsDirectory(os_stat_type const& s) { return (s.st_mode & _S_IFDIR) != 0; }
#else
using os_stat_type = struct stat;
int os_stat(std::string const& path, os_stat_type& s) {
  return stat(path.c_str(), &s);
}
bool IsRegular(os_stat_type const& s) { return S_ISREG(s.st_mode); }
bool IsDirectory(os_stat_type const& s) { return S_ISDIR(s.st_mode); }
#endif  // _WIN32

}  // namespace

file_status status(std::string const& path, std::error_code& ec) noexcept {
  os_stat_type stat{};
  ec.clear();
  if (os_stat(path, stat) != 0) {
    if (errno == EACCES) return file_status(file_type::unknown);
    if (errno == ENOENT || errno == ENOTDIR) {
      return file_status(file_type::not_found);
    }
    ec.assign(errno, std::generic_category());
    return {};
  }
  if (IsRegular(stat)) return file_status(file_type::regular);
  if (IsDirectory(stat)) return file_status(file_type::directory);
  return file_status(file_type::unknown);
}

std::string PathAppend(std::string const& directory, std::string const& path) {
#if _WIN32
  auto constexpr kSeparator = '\\';
  auto is_separator = [](char c) { return c == '\\' || c == '/'; };
#else
  auto constexpr kSeparator = '/';
  auto is_separator = [](char c) { return c == '/'; };
#endif
  if (path.empty()) return directory;
  if (directory.empty()) return path;
  if (!is_separator(directory.back()) && !is_separator(path.front())) {
    return directory + kSeparator + path;
  }
  if (!is_separator(directory.back()) || !is_separator(path.front())) {
    return directory + path;
  }
  auto r = directory;
  r.pop_back();
  r += path;
  return r;
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
