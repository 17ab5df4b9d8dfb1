// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file base45.h
 * @brief Base45 text encoding (RFC 9285).
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hcert::common {

// Decodes Base45 text into bytes.
// Fails on characters outside the Base45 alphabet, on a dangling single trailing character,
// and on groups whose value does not fit the byte width they encode.
bool Base45Decode(std::string_view text, std::vector<std::uint8_t>& out, std::string* out_error = nullptr);

std::string Base45Encode(std::span<const std::uint8_t> bytes);

} // namespace hcert::common
