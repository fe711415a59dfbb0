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

#include "cloudauth/internal/rest_request.h"
#include "absl/strings/ascii.h"

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

std::string NormalizeHeaderName(std::string header) {
  absl::AsciiStrToLower(&header);
  return header;
}

RestRequest::RestRequest(std::string path, HttpHeaders headers,
                         HttpParameters parameters)
    : path_(std::move(path)),
      headers_(std::move(headers)),
      parameters_(std::move(parameters)) {}

RestRequest& RestRequest::AddHeader(std::string header, std::string value) & {
  headers_[NormalizeHeaderName(std::move(header))].push_back(std::move(value));
  return *this;
}

RestRequest& RestRequest::AddQueryParameter(std::string parameter,
                                            std::string value) & {
  parameters_.emplace_back(std::move(parameter), std::move(value));
  return *this;
}

std::vector<std::string> RestRequest::GetHeader(
    std::string const& header) const {
  auto it = headers_.find(NormalizeHeaderName(header));
  if (it == headers_.end()) return {};
  return it->second;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
