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

#ifndef CLOUDAUTH_OAUTH2_HTTP_CLIENT_FACTORY_H
#define CLOUDAUTH_OAUTH2_HTTP_CLIENT_FACTORY_H

#include "cloudauth/internal/rest_client.h"
#include "cloudauth/options.h"
#include "cloudauth/version.h"
#include <functional>
#include <memory>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/**
 * Creates the HTTP client used for credential discovery.
 *
 * `GoogleDefaultCredentials()` only needs a client to ping the metadata
 * server. Tests inject a factory returning a `MockRestClient`.
 */
using HttpClientFactory =
    std::function<std::unique_ptr<rest_internal::RestClient>(Options const&)>;

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_HTTP_CLIENT_FACTORY_H
