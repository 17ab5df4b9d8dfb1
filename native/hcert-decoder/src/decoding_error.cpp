// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/decoder/decoding_error.h"

namespace hcert::decoder {

const char* ToString(DecodingErrorCode code) {
  switch (code) {
    case DecodingErrorCode::kInputTooLarge:
      return "InputTooLarge";
    case DecodingErrorCode::kBase45Decoding:
      return "Base45DecodingError";
    case DecodingErrorCode::kDecompression:
      return "DecompressionError";
    case DecodingErrorCode::kCborDecoding:
      return "CBORDecodingError";
    case DecodingErrorCode::kMalformedCbor:
      return "MalformedCBORError";
    case DecodingErrorCode::kCborProcessing:
      return "CBORProcessingError";
    case DecodingErrorCode::kCosePayloadDecoding:
      return "COSEPayloadDecodingError";
    case DecodingErrorCode::kPayloadConversion:
      return "PayloadConversionError";
    case DecodingErrorCode::kSchemaDecoding:
      return "SchemaDecodingError";
  }
  return "UnknownDecodingError";
}

std::string DecodingError::Message() const {
  std::string msg = ToString(code);

  if (processing_error) {
    msg += ": ";
    msg += ToString(*processing_error);
  }

  if (code == DecodingErrorCode::kMalformedCbor) {
    msg += ": no CBOR item in " + std::to_string(offending_bytes.size()) + " bytes";
  }

  if (cause) {
    msg += ": " + *cause;
  }

  return msg;
}

} // namespace hcert::decoder
