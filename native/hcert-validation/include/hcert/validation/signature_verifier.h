// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file signature_verifier.h
 * @brief Verifies the COSE_Sign1 signature of a decoded certificate.
 *
 * The decoder never verifies signatures; callers that hold the issuer's key run this on
 * the envelope afterwards.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <hcert/decoder/cryptographic_envelope.h>

#include "hcert/validation/validation_result.h"

namespace hcert::validation {

enum class CoseAlgorithm : std::int64_t {
  ES256 = -7,
  PS256 = -37,
};

struct VerifyOptions {
  // DER-encoded SubjectPublicKeyInfo or DER-encoded X.509 certificate.
  std::optional<std::vector<std::uint8_t>> public_key_bytes;

  // If provided, require the COSE alg header to match.
  std::optional<CoseAlgorithm> expected_alg;
};

/**
 * @brief Converts a PEM public key or PEM X.509 certificate into DER SubjectPublicKeyInfo.
 * @return std::nullopt if @p pem holds neither.
 */
std::optional<std::vector<std::uint8_t>> LoadPublicKeyFromPem(const std::string& pem);

/**
 * @brief Builds the COSE Sig_structure ["Signature1", protected, h'', payload].
 */
bool EncodeSignature1SigStructure(const hcert::decoder::CryptographicEnvelope& envelope,
                                  std::vector<std::uint8_t>& out,
                                  std::string* out_error = nullptr);

/**
 * @brief Verifies @p envelope's signature with the key in @p options.
 *
 * Failure codes: MISSING_ALG, ALG_MISMATCH, UNSUPPORTED_ALG, MISSING_KEY,
 * INVALID_PUBLIC_KEY, SIG_STRUCTURE_ENCODING, SIGNATURE_INVALID.
 */
ValidationResult VerifyCertificateSignature(const hcert::decoder::CryptographicEnvelope& envelope,
                                            const VerifyOptions& options,
                                            std::string_view validator_name = "SignatureVerifier");

} // namespace hcert::validation
