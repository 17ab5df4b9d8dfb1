// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file cryptographic_envelope.h
 * @brief The COSE_Sign1 envelope of a health certificate and its extractor.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <tinycbor/cbor.h>

namespace hcert::decoder {

// COSE header labels (RFC 9052).
inline constexpr std::int64_t kCoseHeaderAlg = 1;
inline constexpr std::int64_t kCoseHeaderKid = 4;

/**
 * @brief Reasons a CBOR item does not have the COSE_Sign1 shape.
 *
 * Reported positionally: the first index that does not match wins.
 */
enum class CborProcessingError {
  kContentMissing,
  kProtectedParameterMissing,
  kUnprotectedParameterMissing,
  kPayloadParameterMissing,
  kSignatureParameterMissing,
};

const char* ToString(CborProcessingError error);

/**
 * @brief COSE_Sign1 structure: [protected: bstr, unprotected: map, payload: bstr, signature: bstr].
 *
 * The unprotected header is kept as raw encoded CBOR: each key and value is the exact byte
 * sequence found in the envelope, not reinterpreted. Keys are unique by encoded identity.
 */
class CryptographicEnvelope {
 public:
  using Bytes = std::vector<std::uint8_t>;
  using HeaderMap = std::map<Bytes, Bytes>;

  CryptographicEnvelope() = default;
  CryptographicEnvelope(Bytes protected_header, HeaderMap unprotected_header, Bytes payload, Bytes signature);

  const Bytes& protected_header() const { return protected_header_; }
  const HeaderMap& unprotected_header() const { return unprotected_header_; }
  const Bytes& payload() const { return payload_; }
  const Bytes& signature() const { return signature_; }

  // COSE 'alg' (label 1). Protected header parameters are preferred.
  std::optional<std::int64_t> Algorithm() const;

  // COSE 'kid' (label 4). Protected header parameters are preferred.
  std::optional<Bytes> KeyId() const;

  bool operator==(const CryptographicEnvelope&) const = default;

 private:
  Bytes protected_header_;
  HeaderMap unprotected_header_;
  Bytes payload_;
  Bytes signature_;
};

/**
 * @brief Matches @p value against the tagged COSE_Sign1 array shape.
 *
 * The tag number itself is not checked. The array must hold at least four elements;
 * additional trailing elements are ignored.
 *
 * @return true and fills @p out on success; false and sets @p out_error otherwise.
 */
bool ExtractEnvelope(CborValue value, CryptographicEnvelope& out, CborProcessingError* out_error = nullptr);

} // namespace hcert::decoder
