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

#ifndef CLOUDAUTH_INTERNAL_HTTP_PAYLOAD_H
#define CLOUDAUTH_INTERNAL_HTTP_PAYLOAD_H

#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/span.h"
#include <cstddef>
#include <memory>
#include <string>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// The body of an HTTP response.
class HttpPayload {
 public:
  static constexpr std::size_t kDefaultReadSize = 64 * 1024;
  virtual ~HttpPayload() = default;

  // Reads up to `buffer.size()` bytes from the payload into the buffer.
  // Returns the number of bytes read, 0 once the payload is exhausted.
  virtual StatusOr<std::size_t> Read(absl::Span<char> buffer) = 0;
};

/// An `HttpPayload` already held in memory.
class StringHttpPayload : public HttpPayload {
 public:
  explicit StringHttpPayload(std::string contents)
      : contents_(std::move(contents)) {}

  StatusOr<std::size_t> Read(absl::Span<char> buffer) override;

 private:
  std::string contents_;
  std::size_t offset_ = 0;
};

/// Reads the full payload into a string.
StatusOr<std::string> ReadAll(
    std::unique_ptr<HttpPayload> payload,
    std::size_t read_size = HttpPayload::kDefaultReadSize);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_HTTP_PAYLOAD_H
