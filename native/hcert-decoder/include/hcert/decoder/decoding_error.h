// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file decoding_error.h
 * @brief Typed failures of the HCERT decode pipeline.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hcert/decoder/cryptographic_envelope.h"

namespace hcert::decoder {

enum class DecodingErrorCode {
  kInputTooLarge,
  kBase45Decoding,
  kDecompression,
  kCborDecoding,
  kMalformedCbor,
  kCborProcessing,
  kCosePayloadDecoding,
  kPayloadConversion,
  kSchemaDecoding,
};

const char* ToString(DecodingErrorCode code);

/**
 * @brief The first failure of a decode, with enough context for diagnostics.
 *
 * - cause: the underlying error text. Absent for the "decoded but no item" flavours of
 *   kCosePayloadDecoding and kPayloadConversion.
 * - offending_bytes: the bytes that held no CBOR item (kMalformedCbor only).
 * - processing_error: the COSE_Sign1 shape mismatch (kCborProcessing only).
 */
struct DecodingError {
  DecodingErrorCode code = DecodingErrorCode::kBase45Decoding;
  std::optional<std::string> cause;
  std::vector<std::uint8_t> offending_bytes;
  std::optional<CborProcessingError> processing_error;

  std::string Message() const;

  static DecodingError WithCause(DecodingErrorCode code, std::optional<std::string> cause) {
    DecodingError e;
    e.code = code;
    e.cause = std::move(cause);
    return e;
  }

  static DecodingError MalformedCbor(std::vector<std::uint8_t> offending_bytes) {
    DecodingError e;
    e.code = DecodingErrorCode::kMalformedCbor;
    e.offending_bytes = std::move(offending_bytes);
    return e;
  }

  static DecodingError CborProcessing(CborProcessingError error) {
    DecodingError e;
    e.code = DecodingErrorCode::kCborProcessing;
    e.processing_error = error;
    return e;
  }
};

} // namespace hcert::decoder
