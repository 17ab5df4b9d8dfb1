// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file cryptographic_envelope.cpp
 * @brief COSE_Sign1 envelope extraction and header lookups.
 */

#include "hcert/decoder/cryptographic_envelope.h"

#include <utility>

#include <hcert/common/cbor_primitives.h>
#include <hcert/common/logging.h>

namespace hcert::decoder {

namespace {

namespace cbor = hcert::common::cbor;

bool Fail(CborProcessingError* out_error, CborProcessingError error) {
  if (out_error) *out_error = error;
  return false;
}

// Encoded form of a small non-negative integer label (major type 0, value < 24).
CryptographicEnvelope::Bytes EncodedLabel(std::int64_t label) {
  return CryptographicEnvelope::Bytes{static_cast<std::uint8_t>(label)};
}

bool ParseProtectedMap(const CryptographicEnvelope::Bytes& bytes, CborParser& parser, CborValue& map) {
  if (bytes.empty()) {
    return false;
  }
  if (cbor::DecodeSingleItem(bytes, parser, map) != cbor::ItemDecodeStatus::kDecoded) {
    return false;
  }
  return cbor_value_is_map(&map);
}

const CryptographicEnvelope::Bytes* FindUnprotected(const CryptographicEnvelope::HeaderMap& headers, std::int64_t label) {
  const auto it = headers.find(EncodedLabel(label));
  return it == headers.end() ? nullptr : &it->second;
}

} // namespace

const char* ToString(CborProcessingError error) {
  switch (error) {
    case CborProcessingError::kContentMissing:
      return "contentMissing";
    case CborProcessingError::kProtectedParameterMissing:
      return "protectedParameterMissing";
    case CborProcessingError::kUnprotectedParameterMissing:
      return "unprotectedParameterMissing";
    case CborProcessingError::kPayloadParameterMissing:
      return "payloadParameterMissing";
    case CborProcessingError::kSignatureParameterMissing:
      return "signatureParameterMissing";
  }
  return "unknown";
}

CryptographicEnvelope::CryptographicEnvelope(Bytes protected_header, HeaderMap unprotected_header, Bytes payload, Bytes signature)
    : protected_header_(std::move(protected_header)),
      unprotected_header_(std::move(unprotected_header)),
      payload_(std::move(payload)),
      signature_(std::move(signature)) {}

std::optional<std::int64_t> CryptographicEnvelope::Algorithm() const {
  CborParser parser;
  CborValue map;
  if (ParseProtectedMap(protected_header_, parser, map)) {
    std::optional<std::int64_t> alg;
    if (cbor::TryReadInt64FromMap(map, kCoseHeaderAlg, alg) && alg) {
      return alg;
    }
  }

  const Bytes* raw = FindUnprotected(unprotected_header_, kCoseHeaderAlg);
  if (!raw) {
    return std::nullopt;
  }

  CborParser value_parser;
  CborValue value;
  if (cbor::DecodeSingleItem(*raw, value_parser, value) != cbor::ItemDecodeStatus::kDecoded || !cbor_value_is_integer(&value)) {
    return std::nullopt;
  }

  std::int64_t alg = 0;
  if (cbor_value_get_int64(&value, &alg) != CborNoError) {
    return std::nullopt;
  }
  return alg;
}

std::optional<CryptographicEnvelope::Bytes> CryptographicEnvelope::KeyId() const {
  CborParser parser;
  CborValue map;
  if (ParseProtectedMap(protected_header_, parser, map)) {
    std::optional<Bytes> kid;
    if (cbor::TryReadByteStringFromMap(map, kCoseHeaderKid, kid) && kid) {
      return kid;
    }
  }

  const Bytes* raw = FindUnprotected(unprotected_header_, kCoseHeaderKid);
  if (!raw) {
    return std::nullopt;
  }

  CborParser value_parser;
  CborValue value;
  if (cbor::DecodeSingleItem(*raw, value_parser, value) != cbor::ItemDecodeStatus::kDecoded) {
    return std::nullopt;
  }

  Bytes kid;
  if (!cbor::ReadByteString(&value, kid)) {
    return std::nullopt;
  }
  return kid;
}

bool ExtractEnvelope(CborValue value, CryptographicEnvelope& out, CborProcessingError* out_error) {
  if (!cbor_value_is_tag(&value)) {
    return Fail(out_error, CborProcessingError::kContentMissing);
  }
  CborTag tag = 0;
  if (cbor_value_get_tag(&value, &tag) != CborNoError) {
    return Fail(out_error, CborProcessingError::kContentMissing);
  }
  if (tag != cbor::kCoseSign1Tag) {
    hcert::common::Logger()->debug("COSE_Sign1 envelope carries tag {} instead of {}", tag, cbor::kCoseSign1Tag);
  }
  // Exactly one tag; a nested tag leaves a tag where the array should be.
  if (cbor_value_advance_fixed(&value) != CborNoError || !cbor_value_is_array(&value)) {
    return Fail(out_error, CborProcessingError::kContentMissing);
  }

  CborValue arr;
  if (cbor_value_enter_container(&value, &arr) != CborNoError) {
    return Fail(out_error, CborProcessingError::kContentMissing);
  }

  // 0: protected (bstr)
  CryptographicEnvelope::Bytes protected_header;
  if (cbor_value_at_end(&arr) || !cbor::ReadByteString(&arr, protected_header)) {
    return Fail(out_error, CborProcessingError::kProtectedParameterMissing);
  }

  // 1: unprotected (map), kept as raw encoded key/value pairs.
  if (cbor_value_at_end(&arr) || !cbor_value_is_map(&arr)) {
    return Fail(out_error, CborProcessingError::kUnprotectedParameterMissing);
  }

  CryptographicEnvelope::HeaderMap unprotected_header;
  {
    CborValue entry;
    if (cbor_value_enter_container(&arr, &entry) != CborNoError) {
      return Fail(out_error, CborProcessingError::kUnprotectedParameterMissing);
    }

    while (!cbor_value_at_end(&entry)) {
      CryptographicEnvelope::Bytes key;
      CryptographicEnvelope::Bytes raw_value;
      if (!cbor::CopyRawCborItemBytes(entry, key) || !cbor::SkipAny(&entry) || cbor_value_at_end(&entry) ||
          !cbor::CopyRawCborItemBytes(entry, raw_value) || !cbor::SkipAny(&entry)) {
        return Fail(out_error, CborProcessingError::kUnprotectedParameterMissing);
      }
      unprotected_header.insert_or_assign(std::move(key), std::move(raw_value));
    }

    if (cbor_value_leave_container(&arr, &entry) != CborNoError) {
      return Fail(out_error, CborProcessingError::kUnprotectedParameterMissing);
    }
  }

  // 2: payload (bstr)
  CryptographicEnvelope::Bytes payload;
  if (cbor_value_at_end(&arr) || !cbor::ReadByteString(&arr, payload)) {
    return Fail(out_error, CborProcessingError::kPayloadParameterMissing);
  }

  // 3: signature (bstr)
  CryptographicEnvelope::Bytes signature;
  if (cbor_value_at_end(&arr) || !cbor::ReadByteString(&arr, signature)) {
    return Fail(out_error, CborProcessingError::kSignatureParameterMissing);
  }

  out = CryptographicEnvelope(std::move(protected_header), std::move(unprotected_header), std::move(payload), std::move(signature));
  return true;
}

} // namespace hcert::decoder
