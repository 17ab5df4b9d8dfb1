// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/decoder/decoder_options.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace hcert::decoder {

namespace {

std::size_t ReadSize(const nlohmann::json& value, const char* key) {
  if (!value.is_number_unsigned()) {
    throw std::invalid_argument(std::string("decoder option '") + key + "' must be an unsigned integer");
  }
  return value.get<std::size_t>();
}

} // namespace

DecoderOptions DecoderOptions::FromJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("decoder options must be a JSON object");
  }

  DecoderOptions options;

  if (const auto it = document.find("prefix"); it != document.end()) {
    if (!it->is_string()) {
      throw std::invalid_argument("decoder option 'prefix' must be a string");
    }
    options.prefix = it->get<std::string>();
  }

  if (const auto it = document.find("strictFieldPresence"); it != document.end()) {
    if (!it->is_boolean()) {
      throw std::invalid_argument("decoder option 'strictFieldPresence' must be a boolean");
    }
    options.schema.strict_field_presence = it->get<bool>();
  }

  if (const auto it = document.find("maxInputLength"); it != document.end()) {
    if (it->is_null()) {
      options.max_input_length = std::nullopt;
    } else {
      options.max_input_length = ReadSize(*it, "maxInputLength");
    }
  }

  if (const auto it = document.find("maxDecompressedSize"); it != document.end()) {
    options.max_decompressed_size = ReadSize(*it, "maxDecompressedSize");
  }

  return options;
}

DecoderOptions LoadDecoderOptions(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("failed to open file: " + path);
  }

  std::stringstream buffer;
  buffer << f.rdbuf();

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("failed to parse decoder options " + path + ": " + e.what());
  }

  return DecoderOptions::FromJson(document);
}

} // namespace hcert::decoder
