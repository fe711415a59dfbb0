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

#ifndef CLOUDAUTH_INTERNAL_REST_CONTEXT_H
#define CLOUDAUTH_INTERNAL_REST_CONTEXT_H

#include "cloudauth/internal/rest_request.h"
#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include <string>
#include <utility>
#include <vector>

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * Per-call state for a single HTTP request.
 *
 * The `Options` configure the transport for this call only (e.g.
 * `TransferTimeoutOption`). Decorators may add headers without copying the
 * caller's `RestRequest`.
 */
class RestContext {
 public:
  RestContext() = default;
  explicit RestContext(Options options, HttpHeaders headers)
      : options_(std::move(options)), headers_(std::move(headers)) {}
  explicit RestContext(Options options) : RestContext(std::move(options), {}) {}

  Options const& options() const { return options_; }

  HttpHeaders const& headers() const { return headers_; }

  RestContext& AddHeader(std::string header, std::string value) &;
  RestContext&& AddHeader(std::string header, std::string value) && {
    return std::move(AddHeader(std::move(header), std::move(value)));
  }

  // Vector is empty if header name is not found.
  std::vector<std::string> GetHeader(std::string header) const;

 private:
  Options options_;
  HttpHeaders headers_;
};

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_REST_CONTEXT_H
