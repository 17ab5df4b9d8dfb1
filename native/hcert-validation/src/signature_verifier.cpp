// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file signature_verifier.cpp
 * @brief COSE_Sign1 signature verification over a CryptographicEnvelope.
 */

#include "hcert/validation/signature_verifier.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tinycbor/cbor.h>

#include <hcert/common/logging.h>

#include "internal/openssl_utils.h"

namespace hcert::validation {

namespace {

using hcert::decoder::CryptographicEnvelope;

constexpr const char* kSignature1Context = "Signature1";

ValidationResult Fail(std::string_view validator_name,
                      std::string message,
                      std::string error_code,
                      std::optional<std::string> property = std::nullopt) {
  hcert::common::Logger()->info("{}: {} ({})", validator_name, message, error_code);

  ValidationFailure f;
  f.message = std::move(message);
  f.error_code = std::move(error_code);
  f.property_name = std::move(property);
  std::vector<ValidationFailure> failures;
  failures.push_back(std::move(f));
  return ValidationResult::Failure(std::string(validator_name), std::move(failures));
}

CborError EncodeSigStructureInto(const CryptographicEnvelope& envelope, std::vector<std::uint8_t>& buf, size_t& used) {
  CborEncoder enc;
  cbor_encoder_init(&enc, buf.data(), buf.size(), 0);

  CborEncoder arr;
  CborError err = cbor_encoder_create_array(&enc, &arr, 4);
  if (err != CborNoError) return err;

  err = cbor_encode_text_stringz(&arr, kSignature1Context);
  if (err != CborNoError) return err;

  const auto& body_protected = envelope.protected_header();
  err = cbor_encode_byte_string(&arr, body_protected.data(), body_protected.size());
  if (err != CborNoError) return err;

  // external_aad = empty bstr
  err = cbor_encode_byte_string(&arr, nullptr, 0);
  if (err != CborNoError) return err;

  const auto& payload = envelope.payload();
  err = cbor_encode_byte_string(&arr, payload.data(), payload.size());
  if (err != CborNoError) return err;

  err = cbor_encoder_close_container(&enc, &arr);
  if (err != CborNoError) return err;

  used = cbor_encoder_get_buffer_size(&enc, buf.data());
  return CborNoError;
}

} // namespace

std::optional<std::vector<std::uint8_t>> LoadPublicKeyFromPem(const std::string& pem) {
  auto key = internal::LoadPublicKeyOrCertFromPem(pem);
  if (!key) {
    return std::nullopt;
  }
  return internal::EncodePublicKeyDer(key.get());
}

bool EncodeSignature1SigStructure(const CryptographicEnvelope& envelope,
                                  std::vector<std::uint8_t>& out,
                                  std::string* out_error) {
  if (out_error) out_error->clear();

  out.assign(64 + envelope.protected_header().size() + envelope.payload().size(), 0);
  while (true) {
    size_t used = 0;
    const CborError err = EncodeSigStructureInto(envelope, out, used);
    if (err == CborErrorOutOfMemory) {
      out.assign(out.size() * 2, 0);
      continue;
    }
    if (err != CborNoError) {
      if (out_error) *out_error = cbor_error_string(err);
      out.clear();
      return false;
    }
    out.resize(used);
    return true;
  }
}

ValidationResult VerifyCertificateSignature(const CryptographicEnvelope& envelope,
                                            const VerifyOptions& options,
                                            std::string_view validator_name) {
  const auto parsed_alg = envelope.Algorithm();
  if (!parsed_alg) {
    return Fail(validator_name, "Missing COSE 'alg' header (label 1)", "MISSING_ALG", "alg");
  }

  if (options.expected_alg && static_cast<std::int64_t>(*options.expected_alg) != *parsed_alg) {
    return Fail(validator_name, "COSE 'alg' did not match expected value", "ALG_MISMATCH", "alg");
  }

  CoseAlgorithm alg;
  switch (*parsed_alg) {
    case static_cast<std::int64_t>(CoseAlgorithm::ES256):
      alg = CoseAlgorithm::ES256;
      break;
    case static_cast<std::int64_t>(CoseAlgorithm::PS256):
      alg = CoseAlgorithm::PS256;
      break;
    default:
      return Fail(validator_name, "Unsupported COSE algorithm", "UNSUPPORTED_ALG", "alg");
  }

  if (!options.public_key_bytes) {
    return Fail(validator_name, "No verification key provided (VerifyOptions.public_key_bytes is required)", "MISSING_KEY");
  }

  auto key = internal::LoadPublicKeyOrCertFromDer(*options.public_key_bytes);
  if (!key) {
    return Fail(validator_name, "Failed to parse public key bytes", "INVALID_PUBLIC_KEY");
  }

  std::vector<std::uint8_t> tbs;
  std::string encode_error;
  if (!EncodeSignature1SigStructure(envelope, tbs, &encode_error)) {
    return Fail(validator_name, "Failed to encode Sig_structure: " + encode_error, "SIG_STRUCTURE_ENCODING");
  }

  bool ok = false;
  switch (alg) {
    case CoseAlgorithm::ES256:
      ok = internal::VerifyEs256(key.get(), tbs, envelope.signature());
      break;
    case CoseAlgorithm::PS256:
      ok = internal::VerifyPs256(key.get(), tbs, envelope.signature());
      break;
  }

  if (!ok) {
    return Fail(validator_name, "Signature verification failed", "SIGNATURE_INVALID");
  }

  std::unordered_map<std::string, std::string> metadata;
  metadata.emplace("alg", std::to_string(*parsed_alg));
  metadata.emplace("payloadLength", std::to_string(envelope.payload().size()));
  return ValidationResult::Success(std::string(validator_name), std::move(metadata));
}

} // namespace hcert::validation
