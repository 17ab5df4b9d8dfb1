// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file decoder_options.h
 * @brief Configuration accepted by HcertDecoder.
 */

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <hcert/common/compression.h>

namespace hcert::decoder {

inline constexpr const char* kDefaultCertificatePrefix = "HC1:";

struct SchemaOptions {
  // When false, absent string fields inside vaccination/test/recovery entries are accepted
  // as empty strings. Top-level claims, dates and numbers are always required.
  bool strict_field_presence = true;
};

struct DecoderOptions {
  // Stripped from the front of the input when present. Absence is not an error.
  std::string prefix = kDefaultCertificatePrefix;

  SchemaOptions schema;

  // Inputs longer than this (in bytes, prefix included) are rejected before Base45 decoding.
  std::optional<std::size_t> max_input_length;

  // Upper bound for the inflated CBOR when the payload is zlib-compressed.
  std::size_t max_decompressed_size = hcert::common::kDefaultMaxInflatedSize;

  /**
   * @brief Reads options from a JSON object.
   *
   * Recognized keys: "prefix" (string), "strictFieldPresence" (bool), "maxInputLength"
   * (unsigned or null), "maxDecompressedSize" (unsigned). Missing keys keep their defaults;
   * unknown keys are ignored.
   *
   * @throws std::invalid_argument when the document is not an object or a key has the wrong type.
   */
  static DecoderOptions FromJson(const nlohmann::json& document);
};

/**
 * @brief Loads DecoderOptions from a JSON file.
 * @throws std::runtime_error when the file cannot be read or parsed.
 * @throws std::invalid_argument when the document is not valid configuration.
 */
DecoderOptions LoadDecoderOptions(const std::string& path);

} // namespace hcert::decoder
