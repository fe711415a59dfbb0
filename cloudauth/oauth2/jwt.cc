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

#include "cloudauth/oauth2/jwt.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/base64_transforms.h"
#include "cloudauth/internal/make_status.h"
#include "cloudauth/internal/openssl_util.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace cloudauth {
namespace oauth2 {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace {

std::intmax_t ToEpochSeconds(std::chrono::system_clock::time_point tp) {
  return static_cast<std::intmax_t>(std::chrono::system_clock::to_time_t(tp));
}

// Saturates claims outside the range of `std::intmax_t`.
std::intmax_t ClaimSeconds(nlohmann::json const& claim) {
  using limits = std::numeric_limits<std::intmax_t>;
  if (claim.is_number_unsigned()) {
    auto const v = claim.get<std::uintmax_t>();
    return v > static_cast<std::uintmax_t>(limits::max())
               ? limits::max()
               : static_cast<std::intmax_t>(v);
  }
  if (claim.is_number_integer()) return claim.get<std::intmax_t>();
  auto const v = claim.get<double>();
  if (v >= static_cast<double>(limits::max())) return limits::max();
  if (v <= static_cast<double>(limits::min())) return limits::min();
  return static_cast<std::intmax_t>(v);
}

StatusOr<nlohmann::json> DecodeSegment(absl::string_view encoded,
                                       char const* name) {
  auto bytes = internal::UrlsafeBase64Decode(encoded);
  if (!bytes) return std::move(bytes).status();
  auto json = nlohmann::json::parse(*bytes, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return internal::ParseError(
        absl::StrCat("Can't parse segment: ", *bytes),
        CLOUDAUTH_ERROR_INFO().WithMetadata("segment", name));
  }
  return json;
}

struct DecodedToken {
  nlohmann::json header;
  nlohmann::json payload;
  std::string signed_section;
  std::string signature;
};

StatusOr<DecodedToken> UnverifiedDecode(std::string const& token) {
  if (std::count(token.begin(), token.end(), '.') != 2) {
    return internal::ParseError("Wrong number of segments in token.",
                                CLOUDAUTH_ERROR_INFO());
  }
  std::vector<absl::string_view> segments = absl::StrSplit(token, '.');
  auto header = DecodeSegment(segments[0], "header");
  if (!header) return std::move(header).status();
  auto payload = DecodeSegment(segments[1], "payload");
  if (!payload) return std::move(payload).status();
  auto signature = internal::UrlsafeBase64Decode(segments[2]);
  if (!signature) return std::move(signature).status();
  return DecodedToken{*std::move(header), *std::move(payload),
                      absl::StrCat(segments[0], ".", segments[1]),
                      *std::move(signature)};
}

Status VerifyIatAndExp(nlohmann::json const& payload,
                       std::chrono::system_clock::time_point tp) {
  for (auto const* key : {"iat", "exp"}) {
    auto const i = payload.find(key);
    if (i == payload.end()) {
      return internal::VerificationError(
          absl::StrCat("Token does not contain required claim ", key),
          CLOUDAUTH_ERROR_INFO());
    }
    if (!i->is_number()) {
      return internal::VerificationError(
          absl::StrCat("Token claim ", key, " is not a number"),
          CLOUDAUTH_ERROR_INFO());
    }
  }
  // The claims come from the token, only the local clock is shifted by the
  // skew so the comparisons cannot overflow.
  auto const now = ToEpochSeconds(tp);
  auto const skew = static_cast<std::intmax_t>(kJwtClockSkew.count());
  auto const iat = ClaimSeconds(payload.at("iat"));
  if (now + skew < iat) {
    return internal::VerificationError(
        absl::StrCat("Token used too early, ", now, " < ", iat),
        CLOUDAUTH_ERROR_INFO());
  }
  auto const exp = ClaimSeconds(payload.at("exp"));
  if (exp < now - skew) {
    return internal::VerificationError(
        absl::StrCat("Token expired, ", exp, " < ", now),
        CLOUDAUTH_ERROR_INFO());
  }
  return Status{};
}

}  // namespace

StatusOr<std::shared_ptr<RsaSigner>> RsaSigner::FromString(
    std::string pem_private_key, absl::optional<std::string> key_id) {
  auto status = internal::CheckPrivateKey(pem_private_key);
  if (!status.ok()) return status;
  return std::shared_ptr<RsaSigner>(
      new RsaSigner(std::move(pem_private_key), std::move(key_id)));
}

StatusOr<std::string> RsaSigner::Sign(std::string const& message) const {
  return internal::SignUsingSha256(message, pem_);
}

bool VerifySignature(std::string const& message, std::string const& signature,
                     std::string const& certificate_pem) {
  return internal::VerifyUsingSha256(message, signature, certificate_pem);
}

StatusOr<std::vector<std::string>> JwtCertificates::Select(
    absl::optional<std::string> const& key_id) const {
  if (!by_key_id_) return pems_;
  if (key_id) {
    auto const i = by_key_id_->find(*key_id);
    if (i == by_key_id_->end()) {
      return internal::VerificationError(
          absl::StrCat("Certificate for key id ", *key_id, " not found."),
          CLOUDAUTH_ERROR_INFO());
    }
    return std::vector<std::string>{i->second};
  }
  std::vector<std::string> pems;
  for (auto const& kv : *by_key_id_) pems.push_back(kv.second);
  return pems;
}

absl::optional<std::string> JwtKeyId::Resolve(
    absl::optional<std::string> signer_key_id) const {
  switch (mode_) {
    case Mode::kOverride:
      return key_id_;
    case Mode::kSuppress:
      return absl::nullopt;
    case Mode::kDefault:
      break;
  }
  return signer_key_id;
}

StatusOr<std::string> JwtEncode(Signer const& signer,
                                nlohmann::json const& payload,
                                nlohmann::json header, JwtKeyId const& key_id) {
  if (header.is_null()) header = nlohmann::json::object();
  header["typ"] = "JWT";
  header["alg"] = "RS256";
  auto kid = key_id.Resolve(signer.key_id());
  if (kid) {
    header["kid"] = *std::move(kid);
  } else {
    header.erase("kid");
  }

  auto signing_input =
      absl::StrCat(internal::UrlsafeBase64Encode(header.dump()), ".",
                   internal::UrlsafeBase64Encode(payload.dump()));
  auto signature = signer.Sign(signing_input);
  if (!signature) return std::move(signature).status();
  return absl::StrCat(signing_input, ".",
                      internal::UrlsafeBase64Encode(*signature));
}

StatusOr<nlohmann::json> JwtDecodeHeader(std::string const& token) {
  auto decoded = UnverifiedDecode(token);
  if (!decoded) return std::move(decoded).status();
  return std::move(decoded->header);
}

StatusOr<nlohmann::json> JwtDecode(std::string const& token,
                                   JwtDecodeOptions const& options) {
  auto decoded = UnverifiedDecode(token);
  if (!decoded) return std::move(decoded).status();
  if (!options.verify) return std::move(decoded->payload);

  absl::optional<std::string> key_id;
  auto const kid = decoded->header.find("kid");
  if (kid != decoded->header.end() && kid->is_string()) {
    key_id = kid->get<std::string>();
  }
  auto certs = options.certs.Select(key_id);
  if (!certs) return std::move(certs).status();

  auto const verified = std::any_of(
      certs->begin(), certs->end(), [&decoded](std::string const& pem) {
        return VerifySignature(decoded->signed_section, decoded->signature,
                               pem);
      });
  if (!verified) {
    return internal::VerificationError("Could not verify token signature.",
                                       CLOUDAUTH_ERROR_INFO());
  }

  auto status = VerifyIatAndExp(
      decoded->payload, options.now.value_or(std::chrono::system_clock::now()));
  if (!status.ok()) return status;

  if (options.audience) {
    auto const aud = decoded->payload.find("aud");
    if (aud == decoded->payload.end() || !aud->is_string() ||
        aud->get<std::string>() != *options.audience) {
      auto const actual = aud == decoded->payload.end() ? std::string("null")
                          : aud->is_string() ? aud->get<std::string>()
                                             : aud->dump();
      return internal::VerificationError(
          absl::StrCat("Token has wrong audience ", actual, ", expected ",
                       *options.audience),
          CLOUDAUTH_ERROR_INFO());
    }
  }
  return std::move(decoded->payload);
}

CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace oauth2
}  // namespace cloudauth
