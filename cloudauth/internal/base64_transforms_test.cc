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

#include "cloudauth/internal/base64_transforms.h"
#include "cloudauth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::cloudauth::testing_util::ErrorReasonIs;
using ::cloudauth::testing_util::IsOkAndHolds;
using ::cloudauth::testing_util::StatusIs;
using ::testing::AllOf;
using ::testing::HasSubstr;

TEST(Base64Transforms, EncodeRfc4648Vectors) {
  EXPECT_EQ("", UrlsafeBase64Encode(""));
  EXPECT_EQ("Zg", UrlsafeBase64Encode("f"));
  EXPECT_EQ("Zm8", UrlsafeBase64Encode("fo"));
  EXPECT_EQ("Zm9v", UrlsafeBase64Encode("foo"));
  EXPECT_EQ("Zm9vYg", UrlsafeBase64Encode("foob"));
  EXPECT_EQ("Zm9vYmE", UrlsafeBase64Encode("fooba"));
  EXPECT_EQ("Zm9vYmFy", UrlsafeBase64Encode("foobar"));
}

TEST(Base64Transforms, EncodeUsesUrlsafeAlphabet) {
  std::string const bytes{'\xfb', '\xff', '\xbf'};
  EXPECT_EQ("-_-_", UrlsafeBase64Encode(bytes));
}

TEST(Base64Transforms, EncodeBinary) {
  std::string const bytes{'\0', '\x10', '\x83', '\x10', '\x51', '\x87'};
  EXPECT_EQ("ABCDEFGH", UrlsafeBase64Encode(bytes));
}

TEST(Base64Transforms, Decode) {
  EXPECT_THAT(UrlsafeBase64Decode(""), IsOkAndHolds(""));
  EXPECT_THAT(UrlsafeBase64Decode("Zg"), IsOkAndHolds("f"));
  EXPECT_THAT(UrlsafeBase64Decode("Zm8"), IsOkAndHolds("fo"));
  EXPECT_THAT(UrlsafeBase64Decode("Zm9vYmFy"), IsOkAndHolds("foobar"));
  EXPECT_THAT(UrlsafeBase64Decode("-_-_"),
              IsOkAndHolds(std::string{'\xfb', '\xff', '\xbf'}));
}

TEST(Base64Transforms, DecodeAcceptsPadding) {
  EXPECT_THAT(UrlsafeBase64Decode("Zg=="), IsOkAndHolds("f"));
  EXPECT_THAT(UrlsafeBase64Decode("Zm8="), IsOkAndHolds("fo"));
}

TEST(Base64Transforms, DecodeRejectsInvalidLength) {
  EXPECT_THAT(UrlsafeBase64Decode("Zm9vY"),
              AllOf(StatusIs(StatusCode::kInvalidArgument,
                             HasSubstr("Invalid base64")),
                    ErrorReasonIs("PARSE_ERROR")));
  EXPECT_THAT(UrlsafeBase64Decode("Zg==="),
              StatusIs(StatusCode::kInvalidArgument));
}

TEST(Base64Transforms, DecodeRejectsInvalidCharacters) {
  EXPECT_THAT(UrlsafeBase64Decode("Zm9v+/=="),
              StatusIs(StatusCode::kInvalidArgument));
  EXPECT_THAT(UrlsafeBase64Decode("Zm 9v"),
              StatusIs(StatusCode::kInvalidArgument));
  EXPECT_THAT(UrlsafeBase64Decode("Zm9v.mFy"),
              StatusIs(StatusCode::kInvalidArgument));
}

TEST(Base64Transforms, RoundTripAllByteValues) {
  std::string bytes;
  for (int i = 0; i != 256; ++i) bytes.push_back(static_cast<char>(i));
  auto encoded = UrlsafeBase64Encode(bytes);
  EXPECT_EQ(encoded.find_first_of("+/="), std::string::npos);
  EXPECT_THAT(UrlsafeBase64Decode(encoded), IsOkAndHolds(bytes));
}

}  // namespace
}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
