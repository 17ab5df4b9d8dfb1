// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "openssl_utils.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace hcert::internal {

namespace {
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

// ES256 uses P-256: 32-byte r and s.
constexpr std::size_t kEs256ComponentSize = 32;

BioPtr MakeBioFromString(const std::string& s) {
  BIO* b = BIO_new_mem_buf(s.data(), static_cast<int>(s.size()));
  return BioPtr(b, &BIO_free);
}

EvpPkeyPtr NoKey() {
  return EvpPkeyPtr(nullptr, &EVP_PKEY_free);
}

} // namespace

EvpPkeyPtr LoadPublicKeyOrCertFromPem(const std::string& pem) {
  auto bio = MakeBioFromString(pem);
  if (!bio) {
    return NoKey();
  }

  if (EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)) {
    return EvpPkeyPtr(pkey, &EVP_PKEY_free);
  }

  // Reset and try certificate.
  bio = MakeBioFromString(pem);
  if (!bio) {
    return NoKey();
  }
  X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
  if (cert) {
    return EvpPkeyPtr(X509_get_pubkey(cert.get()), &EVP_PKEY_free);
  }

  return NoKey();
}

EvpPkeyPtr LoadPublicKeyOrCertFromDer(std::span<const std::uint8_t> der) {
  if (der.empty()) {
    return NoKey();
  }

  const unsigned char* p = der.data();
  const unsigned char* end = der.data() + der.size();
  if (EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()))) {
    // Only accept if the parser consumed the entire buffer.
    if (p == end) {
      return EvpPkeyPtr(pkey, &EVP_PKEY_free);
    }
    EVP_PKEY_free(pkey);
  }

  p = der.data();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())), &X509_free);
  if (cert && p == end) {
    return EvpPkeyPtr(X509_get_pubkey(cert.get()), &EVP_PKEY_free);
  }

  return NoKey();
}

std::optional<std::vector<std::uint8_t>> EncodePublicKeyDer(EVP_PKEY* key) {
  if (!key) {
    return std::nullopt;
  }

  const int len = i2d_PUBKEY(key, nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if (i2d_PUBKEY(key, &out) != len) {
    return std::nullopt;
  }
  return der;
}

std::optional<std::vector<std::uint8_t>> CoseEcdsaRawToDer(std::span<const std::uint8_t> cose_raw_sig) {
  if (cose_raw_sig.size() % 2 != 0 || cose_raw_sig.empty()) {
    return std::nullopt;
  }

  const std::size_t n = cose_raw_sig.size() / 2;
  BIGNUM* r = BN_bin2bn(cose_raw_sig.data(), static_cast<int>(n), nullptr);
  BIGNUM* s = BN_bin2bn(cose_raw_sig.data() + n, static_cast<int>(n), nullptr);
  EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
  if (!r || !s || !sig) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }

  // On success the signature owns r and s.
  if (ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }

  const int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> der(static_cast<std::size_t>(len));
  unsigned char* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != len) {
    return std::nullopt;
  }
  return der;
}

bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> cose_raw_sig) {
  if (cose_raw_sig.size() != 2 * kEs256ComponentSize) {
    return false;
  }

  auto der = CoseEcdsaRawToDer(cose_raw_sig);
  if (!der) {
    return false;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) return false;
  if (EVP_DigestVerifyUpdate(ctx.get(), to_be_signed.data(), to_be_signed.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), der->data(), der->size()) == 1;
}

bool VerifyPs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) return false;

  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) != 1) return false;
  if (EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, -1) != 1) return false;

  if (EVP_DigestVerifyUpdate(ctx.get(), to_be_signed.data(), to_be_signed.size()) != 1) return false;
  return EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;
}

} // namespace hcert::internal
