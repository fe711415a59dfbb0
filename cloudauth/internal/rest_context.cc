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

#include "cloudauth/internal/rest_context.h"

namespace cloudauth {
namespace rest_internal {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

RestContext& RestContext::AddHeader(std::string header, std::string value) & {
  headers_[NormalizeHeaderName(std::move(header))].push_back(std::move(value));
  return *this;
}

std::vector<std::string> RestContext::GetHeader(std::string header) const {
  auto iter = headers_.find(NormalizeHeaderName(std::move(header)));
  if (iter == headers_.end()) return {};
  return iter->second;
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace cloudauth
