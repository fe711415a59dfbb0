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
#include "cloudauth/internal/auth_errors.h"
#include "absl/strings/str_cat.h"
#include <array>
#include <limits>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

constexpr char kPadding = '=';

static_assert(std::numeric_limits<unsigned char>::max() == 255,
              "required by base64 decoder");

constexpr std::array<char, 64> kIndexToChar = {{
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
    'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '-', '_',
}};

// Maps each character to its index plus one, zero marks characters outside
// the alphabet.
std::array<unsigned char, 256> MakeCharToIndexExcessOne() {
  std::array<unsigned char, 256> table{};
  for (std::size_t i = 0; i != kIndexToChar.size(); ++i) {
    table[static_cast<unsigned char>(kIndexToChar[i])] =
        static_cast<unsigned char>(i + 1);
  }
  return table;
}

Status Base64DecodingError(absl::string_view input, std::size_t offset) {
  return ParseError(absl::StrCat("Invalid base64 chunk \"",
                                 input.substr(offset, 4), "\" at offset ",
                                 offset),
                    CLOUDAUTH_ERROR_INFO());
}

}  // namespace

std::string UrlsafeBase64Encode(absl::string_view bytes) {
  std::string rep;
  rep.reserve((bytes.size() + 2) / 3 * 4);
  auto octet = [&bytes](std::size_t i) -> unsigned int {
    return static_cast<unsigned char>(bytes[i]);
  };
  std::size_t i = 0;
  for (; i + 3 <= bytes.size(); i += 3) {
    unsigned int const v = octet(i) << 16 | octet(i + 1) << 8 | octet(i + 2);
    rep.push_back(kIndexToChar[v >> 18]);
    rep.push_back(kIndexToChar[v >> 12 & 0x3f]);
    rep.push_back(kIndexToChar[v >> 6 & 0x3f]);
    rep.push_back(kIndexToChar[v & 0x3f]);
  }
  switch (bytes.size() - i) {
    case 2: {
      unsigned int const v = octet(i) << 16 | octet(i + 1) << 8;
      rep.push_back(kIndexToChar[v >> 18]);
      rep.push_back(kIndexToChar[v >> 12 & 0x3f]);
      rep.push_back(kIndexToChar[v >> 6 & 0x3f]);
      break;
    }
    case 1: {
      unsigned int const v = octet(i) << 16;
      rep.push_back(kIndexToChar[v >> 18]);
      rep.push_back(kIndexToChar[v >> 12 & 0x3f]);
      break;
    }
    default:
      break;
  }
  return rep;
}

StatusOr<std::string> UrlsafeBase64Decode(absl::string_view str) {
  static auto const kCharToIndexExcessOne = MakeCharToIndexExcessOne();

  auto input = str;
  while (!input.empty() && input.back() == kPadding) input.remove_suffix(1);
  if (str.size() - input.size() > 2 || input.size() % 4 == 1) {
    return Base64DecodingError(str, input.size() / 4 * 4);
  }

  std::string result;
  result.reserve(input.size() * 3 / 4);
  unsigned int buffer = 0;
  int bits = 0;
  for (std::size_t i = 0; i != input.size(); ++i) {
    auto index = kCharToIndexExcessOne[static_cast<unsigned char>(input[i])];
    if (index == 0) return Base64DecodingError(str, i / 4 * 4);
    buffer = (buffer << 6) | static_cast<unsigned int>(index - 1);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      result.push_back(static_cast<char>((buffer >> bits) & 0xff));
    }
  }
  // Leftover bits must be zero, otherwise the encoder could not have produced
  // this string.
  if ((buffer & ((1U << bits) - 1)) != 0) {
    return Base64DecodingError(str, input.size() / 4 * 4);
  }
  return result;
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
