// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file cbor_primitives.h
 * @brief Small TinyCBOR decoding primitives shared across the hcert modules.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <tinycbor/cbor.h>

namespace hcert::common::cbor {

// COSE_Sign1 tag is 18 (RFC 9052). HCERT envelopes are always tagged.
constexpr CborTag kCoseSign1Tag = 18;

inline bool ReadByteString(CborValue* v, std::vector<std::uint8_t>& out) {
  if (!cbor_value_is_byte_string(v)) {
    return false;
  }

  size_t len = 0;
  if (cbor_value_calculate_string_length(v, &len) != CborNoError) {
    return false;
  }

  out.resize(len);
  size_t copied = len;
  CborValue next = *v;
  if (cbor_value_copy_byte_string(v, out.data(), &copied, &next) != CborNoError) {
    return false;
  }
  *v = next;
  out.resize(copied);
  return true;
}

inline bool ReadTextString(CborValue* v, std::string& out) {
  if (!cbor_value_is_text_string(v)) {
    return false;
  }

  size_t len = 0;
  if (cbor_value_calculate_string_length(v, &len) != CborNoError) {
    return false;
  }

  out.resize(len);
  size_t copied = len;
  CborValue next = *v;
  if (cbor_value_copy_text_string(v, out.data(), &copied, &next) != CborNoError) {
    return false;
  }
  *v = next;
  out.resize(copied);
  return true;
}

inline bool SkipAny(CborValue* v) {
  return cbor_value_advance(v) == CborNoError;
}

// Scans a CBOR map for an integer key (label) with an integer value.
// - Only integer keys are considered.
// - Non-integer keys are skipped (key + value).
// - On malformed map encoding, returns false.
inline bool TryReadInt64FromMap(CborValue map_value, std::int64_t label, std::optional<std::int64_t>& out_value) {
  out_value = std::nullopt;

  if (!cbor_value_is_map(&map_value)) {
    return false;
  }

  CborValue it = map_value;
  if (cbor_value_enter_container(&map_value, &it) != CborNoError) {
    return false;
  }

  while (!cbor_value_at_end(&it)) {
    if (cbor_value_is_integer(&it)) {
      std::int64_t key = 0;
      if (cbor_value_get_int64(&it, &key) != CborNoError) {
        return false;
      }
      if (cbor_value_advance_fixed(&it) != CborNoError) {
        return false;
      }

      if (key == label && cbor_value_is_integer(&it)) {
        std::int64_t value = 0;
        if (cbor_value_get_int64(&it, &value) != CborNoError) {
          return false;
        }
        out_value = value;
        if (cbor_value_advance_fixed(&it) != CborNoError) {
          return false;
        }
        continue;
      }

      if (cbor_value_advance(&it) != CborNoError) {
        return false;
      }

      continue;
    }

    // Skip non-integer key
    if (cbor_value_advance(&it) != CborNoError) {
      return false;
    }
    if (cbor_value_at_end(&it)) {
      return false;
    }
    if (cbor_value_advance(&it) != CborNoError) {
      return false;
    }
  }

  return cbor_value_leave_container(&map_value, &it) == CborNoError;
}

// Same as TryReadInt64FromMap, but for a byte string value.
inline bool TryReadByteStringFromMap(CborValue map_value,
                                     std::int64_t label,
                                     std::optional<std::vector<std::uint8_t>>& out_value) {
  out_value = std::nullopt;

  if (!cbor_value_is_map(&map_value)) {
    return false;
  }

  CborValue it = map_value;
  if (cbor_value_enter_container(&map_value, &it) != CborNoError) {
    return false;
  }

  while (!cbor_value_at_end(&it)) {
    bool matched = false;
    if (cbor_value_is_integer(&it)) {
      std::int64_t key = 0;
      if (cbor_value_get_int64(&it, &key) != CborNoError) {
        return false;
      }
      matched = key == label;
    }
    if (cbor_value_advance(&it) != CborNoError || cbor_value_at_end(&it)) {
      return false;
    }

    if (matched && cbor_value_is_byte_string(&it)) {
      std::vector<std::uint8_t> bytes;
      if (!ReadByteString(&it, bytes)) {
        return false;
      }
      out_value = std::move(bytes);
      continue;
    }

    if (cbor_value_advance(&it) != CborNoError) {
      return false;
    }
  }

  return cbor_value_leave_container(&map_value, &it) == CborNoError;
}

inline bool CopyRawCborItemBytes(const CborValue& value, std::vector<std::uint8_t>& out) {
  out.clear();

  const uint8_t* start = cbor_value_get_next_byte(&value);
  if (!start) {
    return false;
  }

  CborValue tmp = value;
  if (cbor_value_advance(&tmp) != CborNoError) {
    return false;
  }

  const uint8_t* end = cbor_value_get_next_byte(&tmp);
  // If advancing succeeded, TinyCBOR should always be able to report the next byte.
  // Treat end as valid and monotonic with start.
  out.assign(start, end);
  return true;
}

enum class ItemDecodeStatus {
  kDecoded,
  // The input held no CBOR item at all.
  kNoItem,
  kError,
};

// Initializes @p parser over @p bytes and validates exactly one CBOR data item at the front.
// Trailing bytes after the first item are ignored. The caller keeps @p bytes alive for as long
// as @p out_item is used.
inline ItemDecodeStatus DecodeSingleItem(std::span<const std::uint8_t> bytes,
                                         CborParser& parser,
                                         CborValue& out_item,
                                         std::string* out_error = nullptr) {
  if (out_error) out_error->clear();

  if (bytes.empty()) {
    return ItemDecodeStatus::kNoItem;
  }

  CborError err = cbor_parser_init(bytes.data(), bytes.size(), 0, &parser, &out_item);
  if (err == CborNoError) {
    err = cbor_value_validate(&out_item, CborValidateBasic);
  }

  if (err != CborNoError) {
    if (out_error) *out_error = cbor_error_string(err);
    return ItemDecodeStatus::kError;
  }

  return ItemDecodeStatus::kDecoded;
}

} // namespace hcert::common::cbor
