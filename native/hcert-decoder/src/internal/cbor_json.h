// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <tinycbor/cbor.h>

namespace hcert::decoder::internal {

inline constexpr int kMaxCborJsonDepth = 64;

// Converts the CBOR item at @p it into a generic JSON value and advances @p it past it.
// - Map keys must be integers or text; integers are rendered in decimal ("-260").
// - Byte strings become standard Base64 text.
// - Tags are dropped; their content is converted.
// - Undefined becomes null. Non-finite floats and other simple values are rejected.
bool CborToJson(CborValue* it, nlohmann::json& out, std::string* out_error, int depth = 0);

} // namespace hcert::decoder::internal
