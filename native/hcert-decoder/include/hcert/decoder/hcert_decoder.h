// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file hcert_decoder.h
 * @brief Decodes the textual HCERT wire format into a Certificate.
 */

#include <cstdint>
#include <span>
#include <string_view>

#include "hcert/decoder/decode_result.h"
#include "hcert/decoder/decoder_options.h"

namespace hcert::decoder {

/**
 * @brief The HCERT decode pipeline.
 *
 * prefix strip -> Base45 -> optional zlib inflate -> CBOR -> COSE_Sign1 envelope ->
 * payload CBOR -> claims -> Certificate.
 *
 * Each stage consumes the previous stage's output and the first failure ends the decode.
 * Decode is const and keeps no state between calls, so one decoder can be shared across
 * threads.
 */
class HcertDecoder final {
 public:
  HcertDecoder() = default;
  explicit HcertDecoder(DecoderOptions options);

  /**
   * @brief Decodes @p input, e.g. "HC1:6BF...".
   *
   * On success the certificate's text_representation() is @p input exactly as given,
   * prefix included.
   */
  DecodeResult Decode(std::string_view input) const;

  // Same as Decode(std::string_view), for input held as UTF-8 bytes.
  DecodeResult Decode(std::span<const std::uint8_t> utf8_input) const;

  const DecoderOptions& options() const { return options_; }

 private:
  DecoderOptions options_;
};

} // namespace hcert::decoder
