// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace hcert::internal {

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

EvpPkeyPtr LoadPublicKeyOrCertFromPem(const std::string& pem);

// Loads a public key from DER-encoded SubjectPublicKeyInfo, or from DER-encoded X.509 certificate.
EvpPkeyPtr LoadPublicKeyOrCertFromDer(std::span<const std::uint8_t> der);

// DER SubjectPublicKeyInfo of @p key.
std::optional<std::vector<std::uint8_t>> EncodePublicKeyDer(EVP_PKEY* key);

// COSE encodes ECDSA signatures as raw r||s.
std::optional<std::vector<std::uint8_t>> CoseEcdsaRawToDer(std::span<const std::uint8_t> cose_raw_sig);

bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> cose_raw_sig);
bool VerifyPs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed, std::span<const std::uint8_t> signature);

} // namespace hcert::internal
