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

#include "cloudauth/internal/http_payload.h"
#include "absl/memory/memory.h"
#include <algorithm>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

constexpr std::size_t HttpPayload::kDefaultReadSize;

StatusOr<std::size_t> StringHttpPayload::Read(absl::Span<char> buffer) {
  auto const n = (std::min)(buffer.size(), contents_.size() - offset_);
  std::copy(contents_.begin() + offset_, contents_.begin() + offset_ + n,
            buffer.begin());
  offset_ += n;
  return n;
}

StatusOr<std::string> ReadAll(std::unique_ptr<HttpPayload> payload,
                              std::size_t read_size) {
  std::string output;
  // Large values of read_size could exceed the stack size.
  auto buf = absl::make_unique<char[]>(read_size);
  for (;;) {
    auto n = payload->Read(absl::Span<char>(buf.get(), read_size));
    if (!n) return std::move(n).status();
    if (*n == 0) break;
    output.append(buf.get(), *n);
  }
  return output;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
