// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "cbor_json.h"

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#include <hcert/common/cbor_primitives.h>

namespace hcert::decoder::internal {

namespace {

namespace cbor = hcert::common::cbor;

bool Fail(std::string* out_error, std::string message) {
  if (out_error) *out_error = std::move(message);
  return false;
}

std::string Base64Encode(const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) {
    return {};
  }

  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(), static_cast<int>(bytes.size()));
  out.resize(len > 0 ? static_cast<std::size_t>(len) : 0);
  return out;
}

bool ReadInteger(CborValue* it, nlohmann::json& out, std::string* out_error) {
  if (cbor_value_is_unsigned_integer(it)) {
    std::uint64_t v = 0;
    if (cbor_value_get_uint64(it, &v) != CborNoError) {
      return Fail(out_error, "failed to read unsigned integer");
    }
    out = v;
  } else {
    std::int64_t v = 0;
    if (cbor_value_get_int64_checked(it, &v) != CborNoError) {
      return Fail(out_error, "negative integer out of 64-bit range");
    }
    out = v;
  }
  return cbor_value_advance_fixed(it) == CborNoError || Fail(out_error, "failed to advance past integer");
}

bool ReadMapKey(CborValue* it, std::string& out, std::string* out_error) {
  if (cbor_value_is_integer(it)) {
    nlohmann::json number;
    if (!ReadInteger(it, number, out_error)) {
      return false;
    }
    out = number.dump();
    return true;
  }

  if (cbor_value_is_text_string(it)) {
    return cbor::ReadTextString(it, out) || Fail(out_error, "failed to read text map key");
  }

  return Fail(out_error, "unsupported CBOR map key type");
}

bool ReadFloatingPoint(CborValue* it, nlohmann::json& out, std::string* out_error) {
  double v = 0;
  CborError err = CborNoError;
  switch (cbor_value_get_type(it)) {
    case CborHalfFloatType: {
      float f = 0;
      err = cbor_value_get_half_float_as_float(it, &f);
      v = f;
      break;
    }
    case CborFloatType: {
      float f = 0;
      err = cbor_value_get_float(it, &f);
      v = f;
      break;
    }
    default:
      err = cbor_value_get_double(it, &v);
      break;
  }

  if (err != CborNoError) {
    return Fail(out_error, "failed to read floating point value");
  }
  if (!std::isfinite(v)) {
    return Fail(out_error, "non-finite floating point value has no JSON representation");
  }

  out = v;
  return cbor_value_advance_fixed(it) == CborNoError || Fail(out_error, "failed to advance past floating point value");
}

} // namespace

bool CborToJson(CborValue* it, nlohmann::json& out, std::string* out_error, int depth) {
  if (depth > kMaxCborJsonDepth) {
    return Fail(out_error, "CBOR nesting exceeds " + std::to_string(kMaxCborJsonDepth) + " levels");
  }

  switch (cbor_value_get_type(it)) {
    case CborIntegerType:
      return ReadInteger(it, out, out_error);

    case CborByteStringType: {
      std::vector<std::uint8_t> bytes;
      if (!cbor::ReadByteString(it, bytes)) {
        return Fail(out_error, "failed to read byte string");
      }
      out = Base64Encode(bytes);
      return true;
    }

    case CborTextStringType: {
      std::string text;
      if (!cbor::ReadTextString(it, text)) {
        return Fail(out_error, "failed to read text string");
      }
      out = std::move(text);
      return true;
    }

    case CborArrayType: {
      CborValue element;
      if (cbor_value_enter_container(it, &element) != CborNoError) {
        return Fail(out_error, "failed to enter array");
      }

      out = nlohmann::json::array();
      while (!cbor_value_at_end(&element)) {
        nlohmann::json item;
        if (!CborToJson(&element, item, out_error, depth + 1)) {
          return false;
        }
        out.push_back(std::move(item));
      }

      return cbor_value_leave_container(it, &element) == CborNoError || Fail(out_error, "failed to leave array");
    }

    case CborMapType: {
      CborValue entry;
      if (cbor_value_enter_container(it, &entry) != CborNoError) {
        return Fail(out_error, "failed to enter map");
      }

      out = nlohmann::json::object();
      while (!cbor_value_at_end(&entry)) {
        std::string key;
        if (!ReadMapKey(&entry, key, out_error)) {
          return false;
        }

        nlohmann::json value;
        if (!CborToJson(&entry, value, out_error, depth + 1)) {
          return false;
        }
        // Duplicate keys: the last occurrence wins.
        out[key] = std::move(value);
      }

      return cbor_value_leave_container(it, &entry) == CborNoError || Fail(out_error, "failed to leave map");
    }

    case CborTagType:
      if (cbor_value_advance_fixed(it) != CborNoError) {
        return Fail(out_error, "failed to skip tag");
      }
      return CborToJson(it, out, out_error, depth + 1);

    case CborBooleanType: {
      bool b = false;
      if (cbor_value_get_boolean(it, &b) != CborNoError) {
        return Fail(out_error, "failed to read boolean");
      }
      out = b;
      return cbor_value_advance_fixed(it) == CborNoError || Fail(out_error, "failed to advance past boolean");
    }

    case CborNullType:
    case CborUndefinedType:
      out = nullptr;
      return cbor_value_advance_fixed(it) == CborNoError || Fail(out_error, "failed to advance past null");

    case CborHalfFloatType:
    case CborFloatType:
    case CborDoubleType:
      return ReadFloatingPoint(it, out, out_error);

    case CborSimpleType:
      return Fail(out_error, "unassigned CBOR simple value has no JSON representation");

    case CborInvalidType:
      break;
  }

  return Fail(out_error, "invalid CBOR item");
}

} // namespace hcert::decoder::internal
