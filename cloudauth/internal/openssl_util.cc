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

#include "cloudauth/internal/openssl_util.h"
#include "cloudauth/internal/auth_errors.h"
#include "cloudauth/internal/make_status.h"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/opensslv.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <array>
#include <memory>

namespace cloudauth {
CLOUDAUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

auto constexpr kOpenSslSuccess = 1;

struct OpenSslDeleter {
  void operator()(EVP_MD_CTX* ptr) {
// The name of the function to free an EVP_MD_CTX changed in OpenSSL 1.1.0.
#if (OPENSSL_VERSION_NUMBER < 0x10100000L)  // Older than version 1.1.0.
    EVP_MD_CTX_destroy(ptr);
#else
    EVP_MD_CTX_free(ptr);
#endif
  }

  void operator()(EVP_PKEY* ptr) { EVP_PKEY_free(ptr); }
  void operator()(BIO* ptr) { BIO_free(ptr); }
  void operator()(X509* ptr) { X509_free(ptr); }
};

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, OpenSslDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, OpenSslDeleter>;
using BioPtr = std::unique_ptr<BIO, OpenSslDeleter>;
using X509Ptr = std::unique_ptr<X509, OpenSslDeleter>;

DigestCtxPtr GetDigestCtx() {
#if (OPENSSL_VERSION_NUMBER < 0x10100000L)  // Older than version 1.1.0.
  return DigestCtxPtr(EVP_MD_CTX_create());
#else
  return DigestCtxPtr(EVP_MD_CTX_new());
#endif
}

std::string CaptureSslErrors() {
  std::string msg;
  char const* sep = "";
  while (auto code = ERR_get_error()) {
    // OpenSSL guarantees that 256 bytes is enough.
    auto constexpr kMaxOpenSslErrorLength = 256;
    std::array<char, kMaxOpenSslErrorLength> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    msg += sep;
    msg += buf.data();
    sep = ", ";
  }
  return msg;
}

BioPtr MakeMemBuffer(std::string const& contents) {
  return BioPtr(
      BIO_new_mem_buf(contents.data(), static_cast<int>(contents.size())));
}

StatusOr<PkeyPtr> LoadPrivateKey(std::string const& pem_contents) {
  ERR_clear_error();
  auto pem_buffer = MakeMemBuffer(pem_contents);
  if (!pem_buffer) {
    return InternalError("could not create PEM buffer: " + CaptureSslErrors(),
                         CLOUDAUTH_ERROR_INFO());
  }
  // No password callback, encrypted keys are not supported.
  auto private_key = PkeyPtr(
      PEM_read_bio_PrivateKey(pem_buffer.get(), nullptr, nullptr, nullptr));
  if (!private_key) {
    return ParseError(
        "could not parse PEM to get private key: " + CaptureSslErrors(),
        CLOUDAUTH_ERROR_INFO());
  }
  return StatusOr<PkeyPtr>(std::move(private_key));
}

// Tries the PEM blob as a certificate first, then as a bare public key.
PkeyPtr LoadPublicKey(std::string const& pem_contents) {
  auto cert_buffer = MakeMemBuffer(pem_contents);
  if (!cert_buffer) return nullptr;
  auto cert =
      X509Ptr(PEM_read_bio_X509(cert_buffer.get(), nullptr, nullptr, nullptr));
  if (cert) return PkeyPtr(X509_get_pubkey(cert.get()));

  auto key_buffer = MakeMemBuffer(pem_contents);
  if (!key_buffer) return nullptr;
  return PkeyPtr(
      PEM_read_bio_PUBKEY(key_buffer.get(), nullptr, nullptr, nullptr));
}

}  // namespace

Status CheckPrivateKey(std::string const& pem_contents) {
  auto key = LoadPrivateKey(pem_contents);
  if (!key) return std::move(key).status();
  return Status{};
}

StatusOr<std::string> SignUsingSha256(absl::string_view str,
                                      std::string const& pem_contents) {
  auto private_key = LoadPrivateKey(pem_contents);
  if (!private_key) return std::move(private_key).status();

  auto digest_ctx = GetDigestCtx();
  if (!digest_ctx) {
    return InternalError(
        "could not create context for OpenSSL digest: " + CaptureSslErrors(),
        CLOUDAUTH_ERROR_INFO());
  }
  if (EVP_DigestSignInit(digest_ctx.get(), nullptr, EVP_sha256(), nullptr,
                         private_key->get()) != kOpenSslSuccess) {
    return InternalError(
        "could not initialize signing digest: " + CaptureSslErrors(),
        CLOUDAUTH_ERROR_INFO());
  }
  if (EVP_DigestSignUpdate(digest_ctx.get(), str.data(), str.size()) !=
      kOpenSslSuccess) {
    return InternalError("could not sign blob: " + CaptureSslErrors(),
                         CLOUDAUTH_ERROR_INFO());
  }
  // The signature size depends on the key modulus, query it first.
  std::size_t actual_len = 0;
  if (EVP_DigestSignFinal(digest_ctx.get(), nullptr, &actual_len) !=
      kOpenSslSuccess) {
    return InternalError("could not sign blob: " + CaptureSslErrors(),
                         CLOUDAUTH_ERROR_INFO());
  }
  std::string signature(actual_len, '\0');
  if (EVP_DigestSignFinal(digest_ctx.get(),
                          reinterpret_cast<unsigned char*>(&signature[0]),
                          &actual_len) != kOpenSslSuccess) {
    return InternalError("could not sign blob: " + CaptureSslErrors(),
                         CLOUDAUTH_ERROR_INFO());
  }
  signature.resize(actual_len);
  return signature;
}

bool VerifyUsingSha256(absl::string_view str, absl::string_view signature,
                       std::string const& pem_contents) {
  ERR_clear_error();
  auto public_key = LoadPublicKey(pem_contents);
  auto digest_ctx = GetDigestCtx();
  auto valid = public_key && digest_ctx &&
               EVP_DigestVerifyInit(digest_ctx.get(), nullptr, EVP_sha256(),
                                    nullptr, public_key.get()) ==
                   kOpenSslSuccess &&
               EVP_DigestVerifyUpdate(digest_ctx.get(), str.data(),
                                      str.size()) == kOpenSslSuccess &&
               EVP_DigestVerifyFinal(
                   digest_ctx.get(),
                   reinterpret_cast<unsigned char const*>(signature.data()),
                   signature.size()) == kOpenSslSuccess;
  // Leave a clean error queue for the next OpenSSL caller.
  ERR_clear_error();
  return valid;
}

}  // namespace internal
CLOUDAUTH_INLINE_NAMESPACE_END
}  // namespace cloudauth
