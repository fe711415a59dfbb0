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

#ifndef CLOUDAUTH_OAUTH2_JWT_H
#define CLOUDAUTH_OAUTH2_JWT_H

#include "cloudauth/status_or.h"
#include "cloudauth/version.h"
#include "absl/types/optional.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN

/// Tolerance applied to the `iat` and `exp` claims when verifying tokens.
auto constexpr kJwtClockSkew = std::chrono::seconds(300);

/// The lifetime of self-signed JWTs unless configured otherwise.
auto constexpr kJwtDefaultTokenLifetime = std::chrono::seconds(3600);

/**
 * Produces `RS256` signatures for JWTs and other blobs.
 *
 * Implementations must be safe to call from multiple threads, credentials
 * share a single signer between copies.
 */
class Signer {
 public:
  virtual ~Signer() = default;

  /// Returns the raw signature bytes for @p message.
  virtual StatusOr<std::string> Sign(std::string const& message) const = 0;

  /// The key id placed in the `kid` header of JWTs signed by this signer.
  virtual absl::optional<std::string> key_id() const = 0;
};

/// A `Signer` backed by an RSA private key in PEM format.
class RsaSigner : public Signer {
 public:
  /**
   * Creates a signer from a PEM-encoded private key.
   *
   * Returns a `PARSE_ERROR` if the key cannot be loaded.
   */
  static StatusOr<std::shared_ptr<RsaSigner>> FromString(
      std::string pem_private_key, absl::optional<std::string> key_id = {});

  StatusOr<std::string> Sign(std::string const& message) const override;
  absl::optional<std::string> key_id() const override { return key_id_; }

 private:
  RsaSigner(std::string pem, absl::optional<std::string> key_id)
      : pem_(std::move(pem)), key_id_(std::move(key_id)) {}

  std::string pem_;
  absl::optional<std::string> key_id_;
};

/**
 * Verifies an `RS256` signature.
 *
 * @p certificate_pem may hold an X.509 certificate or a public key. Returns
 * false when the signature does not match or the key material is unusable.
 */
bool VerifySignature(std::string const& message, std::string const& signature,
                     std::string const& certificate_pem);

/**
 * The certificates used to verify a token signature.
 *
 * Either a list of PEM certificates, any of which may verify the token, or a
 * map from key id to certificate. With a map, the token's `kid` header picks
 * the certificate; tokens without a `kid` are checked against every entry.
 */
class JwtCertificates {
 public:
  JwtCertificates() = default;
  // NOLINTNEXTLINE(google-explicit-constructor)
  JwtCertificates(std::string pem) : pems_{std::move(pem)} {}
  // NOLINTNEXTLINE(google-explicit-constructor)
  JwtCertificates(std::vector<std::string> pems) : pems_(std::move(pems)) {}
  // NOLINTNEXTLINE(google-explicit-constructor)
  JwtCertificates(std::map<std::string, std::string> by_key_id)
      : by_key_id_(std::move(by_key_id)) {}

  /// Returns the certificates that may verify a token with @p key_id.
  StatusOr<std::vector<std::string>> Select(
      absl::optional<std::string> const& key_id) const;

 private:
  std::vector<std::string> pems_;
  absl::optional<std::map<std::string, std::string>> by_key_id_;
};

/**
 * Controls the `kid` header written by `JwtEncode()`.
 *
 * By default the signer's key id is used. `Override()` replaces it and
 * `Suppress()` omits the header even when the signer has a key id.
 */
class JwtKeyId {
 public:
  JwtKeyId() = default;

  static JwtKeyId Override(std::string key_id) {
    return JwtKeyId(Mode::kOverride, std::move(key_id));
  }
  static JwtKeyId Suppress() { return JwtKeyId(Mode::kSuppress, {}); }

  /// The `kid` to write, given the signer's own key id.
  absl::optional<std::string> Resolve(
      absl::optional<std::string> signer_key_id) const;

 private:
  enum class Mode { kDefault, kOverride, kSuppress };
  JwtKeyId(Mode mode, std::string key_id)
      : mode_(mode), key_id_(std::move(key_id)) {}

  Mode mode_ = Mode::kDefault;
  std::string key_id_;
};

/**
 * Creates a signed JWT.
 *
 * The header is @p header plus `{"typ": "JWT", "alg": "RS256"}` and the `kid`
 * selected by @p key_id. Segments are base64url encoded without padding.
 */
StatusOr<std::string> JwtEncode(
    Signer const& signer, nlohmann::json const& payload,
    nlohmann::json header = nlohmann::json::object(),
    JwtKeyId const& key_id = {});

/// Returns the decoded header of @p token, without any verification.
StatusOr<nlohmann::json> JwtDecodeHeader(std::string const& token);

struct JwtDecodeOptions {
  JwtCertificates certs;
  /// When false, `JwtDecode()` only parses the token.
  bool verify = true;
  /// If set, the `aud` claim must match this value.
  absl::optional<std::string> audience;
  /// The time used to check `iat` and `exp`, defaults to the system clock.
  absl::optional<std::chrono::system_clock::time_point> now;
};

/**
 * Decodes @p token and, unless disabled in @p options, verifies it.
 *
 * Verification checks the signature against the selected certificates, the
 * presence of `iat` and `exp`, that the current time is within those claims
 * (with `kJwtClockSkew` tolerance), and the audience. Malformed tokens return
 * `PARSE_ERROR`, failed checks return `VERIFICATION_FAILED`.
 *
 * @return the token payload.
 */
StatusOr<nlohmann::json> JwtDecode(std::string const& token,
                                   JwtDecodeOptions const& options);

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth

#endif  // CLOUDAUTH_OAUTH2_JWT_H
