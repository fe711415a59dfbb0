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
#include <gmock/gmock.h>
#include <cstdio>
#include <fstream>
#include <random>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

std::string TempFileName() {
  static std::mt19937_64 gen{std::random_device{}()};
  return PathAppend(::testing::TempDir(),
                    "filesystem-test-" + std::to_string(gen()) + ".txt");
}

TEST(FilesystemTest, PathAppend) {
  struct {
    std::string directory;
    std::string path;
    std::string expected;
  } cases[] = {
      {"", "", ""},
      {"", "file.json", "file.json"},
      {"/home/user", "", "/home/user"},
      {"/home/user", "file.json", "/home/user/file.json"},
      {"/home/user/", "file.json", "/home/user/file.json"},
      {"/home/user", "/file.json", "/home/user/file.json"},
      {"/home/user/", "/file.json", "/home/user/file.json"},
  };
  for (auto const& c : cases) {
    SCOPED_TRACE("Testing " + c.directory + " + " + c.path);
#if _WIN32
    // Only check the cases without an added separator on Windows.
    if (c.directory.empty() || c.path.empty()) {
      EXPECT_EQ(c.expected, PathAppend(c.directory, c.path));
    }
#else
    EXPECT_EQ(c.expected, PathAppend(c.directory, c.path));
#endif  // _WIN32
  }
}

TEST(FilesystemTest, StatusNotFound) {
  std::error_code ec;
  auto const s = status(TempFileName(), ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(status_known(s));
  EXPECT_FALSE(exists(s));
  EXPECT_EQ(file_type::not_found, s.type());
}

TEST(FilesystemTest, StatusRegular) {
  auto const path = TempFileName();
  std::ofstream(path) << "contents";
  std::error_code ec;
  auto const s = status(path, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(exists(s));
  EXPECT_EQ(file_type::regular, s.type());
  EXPECT_EQ(0, std::remove(path.c_str()));
}

TEST(FilesystemTest, StatusDirectory) {
  std::error_code ec;
  auto const s = status(::testing::TempDir(), ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(exists(s));
  EXPECT_EQ(file_type::directory, s.type());
}

TEST(FilesystemTest, DefaultStatus) {
  file_status s;
  EXPECT_FALSE(status_known(s));
  EXPECT_FALSE(exists(s));
}

}  // namespace
}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
