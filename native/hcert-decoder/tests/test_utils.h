// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_utils.h
 * @brief Builders for synthetic health certificates (the decode pipeline run backwards).
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace hcert::tests {

using Bytes = std::vector<std::uint8_t>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

// 2021-06-01T00:00:00Z and 2022-06-01T00:00:00Z.
inline constexpr std::int64_t kIssuedAt = 1622505600;
inline constexpr std::int64_t kExpiresAt = 1654041600;

// CWT claims {1: iss, 4: exp, 6: iat, -260: {1: dcc}} with the given health certificate body.
nlohmann::json MakeClaims(const nlohmann::json& dcc,
                          std::int64_t issued_at = kIssuedAt,
                          std::int64_t expires_at = kExpiresAt,
                          const std::string& issuer = "AT");

nlohmann::json SampleVaccinationDcc();
nlohmann::json SampleTestDcc();
nlohmann::json SampleRecoveryDcc();

// Hex digits to bytes; whitespace is skipped. Throws std::invalid_argument on odd or non-hex input.
Bytes FromHex(std::string_view hex);

// Encodes @p value as CBOR. Object keys spelled as decimal integers ("1", "-260") are
// encoded as CBOR integers, all other keys as text strings.
Bytes EncodeCbor(const nlohmann::json& value);

EvpPkeyPtr GenerateEcP256Key();
EvpPkeyPtr GenerateRsaKey(int bits);
std::string PublicKeyPemFromKey(EVP_PKEY* key);
Bytes PublicKeyDerFromKey(EVP_PKEY* key);

// Encoded protected header map {1: alg} or {1: alg, 4: kid}.
Bytes MakeProtectedHeader(std::int64_t alg, std::optional<Bytes> kid = std::nullopt);

Bytes BuildSigStructure(const Bytes& protected_header, std::span<const std::uint8_t> payload);

// Signs with ES256 and returns the COSE raw signature r||s.
Bytes SignEs256ToCoseRaw(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed);
Bytes SignPs256(EVP_PKEY* key, std::span<const std::uint8_t> to_be_signed);

// [protected, {4: kid}?, payload, signature], tagged 18 unless @p tagged is false.
Bytes MakeCoseSign1(const Bytes& protected_header,
                    std::span<const std::uint8_t> payload,
                    std::span<const std::uint8_t> signature,
                    bool tagged = true,
                    std::optional<Bytes> unprotected_kid = std::nullopt);

// prefix + Base45(zlib?(cose)).
std::string EncodeHcertText(std::span<const std::uint8_t> cose, bool compress = true, const std::string& prefix = "HC1:");

struct SignedCertificate {
  std::string text;
  Bytes cose;
  Bytes payload;
  Bytes public_key_der;
};

// An ES256-signed, tagged, compressed, prefixed certificate carrying @p claims.
SignedCertificate MakeSignedCertificate(const nlohmann::json& claims,
                                        bool compress = true,
                                        const std::string& prefix = "HC1:");

} // namespace hcert::tests
