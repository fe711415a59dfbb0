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

#include "cloudauth/options.h"
#include "cloudauth/internal/rest_options.h"
#include "cloudauth/oauth2/options.h"
#include <gmock/gmock.h>
#include <chrono>
#include <set>
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::testing::ElementsAre;

struct IntOption {
  using Type = int;
};

struct StringOption {
  using Type = std::string;
};

TEST(Options, Empty) {
  Options opts;
  EXPECT_FALSE(opts.has<IntOption>());
  EXPECT_EQ(opts.get<IntOption>(), 0);
  EXPECT_EQ(opts.get<StringOption>(), "");
}

TEST(Options, SetGet) {
  auto opts = Options{}.set<IntOption>(42).set<StringOption>("foo");
  EXPECT_TRUE(opts.has<IntOption>());
  EXPECT_EQ(opts.get<IntOption>(), 42);
  EXPECT_EQ(opts.get<StringOption>(), "foo");

  opts.set<IntOption>(7);
  EXPECT_EQ(opts.get<IntOption>(), 7);
  EXPECT_TRUE(opts.has<StringOption>());
}

TEST(Options, CopyIsIndependent) {
  auto a = Options{}.set<StringOption>("a");
  auto b = a;
  b.set<StringOption>("b");
  EXPECT_EQ(a.get<StringOption>(), "a");
  EXPECT_EQ(b.get<StringOption>(), "b");

  a = b;
  EXPECT_EQ(a.get<StringOption>(), "b");
}

TEST(Options, Merge) {
  auto preferred = Options{}.set<IntOption>(1);
  auto fallback = Options{}.set<IntOption>(2).set<StringOption>("fallback");
  auto merged = internal::MergeOptions(preferred, fallback);
  EXPECT_EQ(merged.get<IntOption>(), 1);
  EXPECT_EQ(merged.get<StringOption>(), "fallback");

  auto from_empty = internal::MergeOptions(Options{}, fallback);
  EXPECT_EQ(from_empty.get<IntOption>(), 2);
}

TEST(Options, CredentialOptions) {
  auto opts =
      Options{}
          .set<oauth2::RefreshStatusCodesOption>({401, 403})
          .set<oauth2::MetadataPingTimeoutOption>(std::chrono::seconds(1))
          .set<rest_internal::TransferTimeoutOption>(
              std::chrono::milliseconds(500));
  EXPECT_THAT(opts.get<oauth2::RefreshStatusCodesOption>(),
              ElementsAre(401, 403));
  EXPECT_EQ(opts.get<oauth2::MetadataPingTimeoutOption>(),
            std::chrono::milliseconds(1000));
  EXPECT_EQ(opts.get<rest_internal::TransferTimeoutOption>(),
            std::chrono::milliseconds(500));
  EXPECT_FALSE(opts.has<oauth2::TokenUriOption>());
}

}  // namespace
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
