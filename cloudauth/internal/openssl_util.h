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

#ifndef CLOUDAUTH_INTERNAL_OPENSSL_UTIL_H
#define CLOUDAUTH_INTERNAL_OPENSSL_UTIL_H

#include "cloudauth/status.h"
#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/strings/string_view.h"
#include <string>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/**
 * Checks that @p pem_contents holds a PEM-encoded private key.
 *
 * Returns a `PARSE_ERROR` status with the OpenSSL error queue in the message
 * if the key cannot be loaded.
 */
Status CheckPrivateKey(std::string const& pem_contents);

/**
 * Signs @p str with the private key in @p pem_contents, using RSA with
 * PKCS#1 v1.5 padding and SHA-256 (the JWT `RS256` algorithm).
 *
 * @return the raw signature bytes.
 */
StatusOr<std::string> SignUsingSha256(absl::string_view str,
                                      std::string const& pem_contents);

/**
 * Verifies an `RS256` signature.
 *
 * @p pem_contents may be an X.509 certificate or a public key, both PEM
 * encoded. Unusable key material is reported as a failed verification.
 */
bool VerifyUsingSha256(absl::string_view str, absl::string_view signature,
                       std::string const& pem_contents);

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth

#endif  // CLOUDAUTH_INTERNAL_OPENSSL_UTIL_H
