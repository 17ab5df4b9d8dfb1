// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file hcert_decoder.cpp
 * @brief Implementation of the HCERT decode pipeline.
 */

#include "hcert/decoder/hcert_decoder.h"

#include <string>
#include <utility>
#include <vector>

#include <tinycbor/cbor.h>

#include <hcert/common/base45.h>
#include <hcert/common/cbor_primitives.h>
#include <hcert/common/compression.h>
#include <hcert/common/logging.h>

#include "hcert/decoder/cryptographic_envelope.h"
#include "hcert/decoder/record_materializer.h"

namespace hcert::decoder {

namespace {

namespace cbor = hcert::common::cbor;

DecodeResult Fail(std::string_view stage, DecodingError error) {
  hcert::common::Logger()->debug("hcert decode failed at {}: {}", stage, error.Message());
  return DecodeResult::Failure(std::move(error));
}

std::string_view StripPrefix(std::string_view input, std::string_view prefix) {
  if (!prefix.empty() && input.starts_with(prefix)) {
    input.remove_prefix(prefix.size());
  }
  return input;
}

} // namespace

HcertDecoder::HcertDecoder(DecoderOptions options) : options_(std::move(options)) {}

DecodeResult HcertDecoder::Decode(std::span<const std::uint8_t> utf8_input) const {
  return Decode(std::string_view(reinterpret_cast<const char*>(utf8_input.data()), utf8_input.size()));
}

DecodeResult HcertDecoder::Decode(std::string_view input) const {
  if (options_.max_input_length && input.size() > *options_.max_input_length) {
    return Fail("input", DecodingError::WithCause(DecodingErrorCode::kInputTooLarge,
                                                  "input of " + std::to_string(input.size()) + " bytes exceeds limit of " +
                                                      std::to_string(*options_.max_input_length)));
  }

  // 1. Prefix
  const std::string_view base45_text = StripPrefix(input, options_.prefix);

  // 2. Base45
  std::vector<std::uint8_t> decoded;
  {
    std::string error;
    if (!hcert::common::Base45Decode(base45_text, decoded, &error)) {
      return Fail("base45", DecodingError::WithCause(DecodingErrorCode::kBase45Decoding, std::move(error)));
    }
  }

  // 3. Optional zlib layer, detected by its stream header.
  std::vector<std::uint8_t> cose_bytes;
  if (hcert::common::LooksLikeZlibStream(decoded)) {
    std::string error;
    if (!hcert::common::ZlibInflate(decoded, cose_bytes, options_.max_decompressed_size, &error)) {
      return Fail("decompress", DecodingError::WithCause(DecodingErrorCode::kDecompression, std::move(error)));
    }
  } else {
    cose_bytes = std::move(decoded);
  }

  // 4. Outer CBOR item
  CborParser outer_parser;
  CborValue outer;
  {
    std::string error;
    switch (cbor::DecodeSingleItem(cose_bytes, outer_parser, outer, &error)) {
      case cbor::ItemDecodeStatus::kDecoded:
        break;
      case cbor::ItemDecodeStatus::kNoItem:
        return Fail("cbor", DecodingError::MalformedCbor(cose_bytes));
      case cbor::ItemDecodeStatus::kError:
        return Fail("cbor", DecodingError::WithCause(DecodingErrorCode::kCborDecoding, std::move(error)));
    }
  }

  // 5. COSE_Sign1 envelope
  CryptographicEnvelope envelope;
  {
    CborProcessingError error = CborProcessingError::kContentMissing;
    if (!ExtractEnvelope(outer, envelope, &error)) {
      return Fail("cose", DecodingError::CborProcessing(error));
    }
  }

  // 6. Payload CBOR item. The parser reads envelope.payload() in place; the envelope is not
  // moved until materialization is done.
  CborParser payload_parser;
  CborValue payload;
  {
    std::string error;
    switch (cbor::DecodeSingleItem(envelope.payload(), payload_parser, payload, &error)) {
      case cbor::ItemDecodeStatus::kDecoded:
        break;
      case cbor::ItemDecodeStatus::kNoItem:
        return Fail("payload", DecodingError::WithCause(DecodingErrorCode::kCosePayloadDecoding, std::nullopt));
      case cbor::ItemDecodeStatus::kError:
        return Fail("payload", DecodingError::WithCause(DecodingErrorCode::kCosePayloadDecoding, std::move(error)));
    }
  }

  // 7. Claims
  CertificateClaims claims;
  {
    MaterializationError error;
    if (!MaterializeClaims(payload, options_.schema, claims, &error)) {
      const auto code = error.kind == MaterializationError::Kind::kSchemaDecoding ? DecodingErrorCode::kSchemaDecoding
                                                                                  : DecodingErrorCode::kPayloadConversion;
      return Fail("claims", DecodingError::WithCause(code, std::move(error.cause)));
    }
  }

  // 8. Bind the input text and the envelope to the claims.
  return DecodeResult::Success(Certificate(std::move(claims), std::move(envelope), std::string(input)));
}

} // namespace hcert::decoder
