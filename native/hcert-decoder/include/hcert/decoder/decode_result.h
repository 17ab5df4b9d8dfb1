// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file decode_result.h
 * @brief Result type returned by HcertDecoder.
 */

#include <optional>
#include <utility>

#include "hcert/decoder/certificate.h"
#include "hcert/decoder/decoding_error.h"

namespace hcert::decoder {

/**
 * @brief Either a fully populated Certificate or the first DecodingError.
 *
 * Never both: a failed decode carries no partial record.
 */
struct DecodeResult {
  bool is_valid = false;
  std::optional<Certificate> certificate;
  std::optional<DecodingError> error;

  static DecodeResult Success(Certificate certificate) {
    DecodeResult r;
    r.is_valid = true;
    r.certificate = std::move(certificate);
    return r;
  }

  static DecodeResult Failure(DecodingError error) {
    DecodeResult r;
    r.is_valid = false;
    r.error = std::move(error);
    return r;
  }
};

} // namespace hcert::decoder
