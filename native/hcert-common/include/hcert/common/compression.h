// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file compression.h
 * @brief zlib (RFC 1950) helpers for the optional HCERT compression layer.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace hcert::common {

// Default upper bound for inflated output (1 MiB).
inline constexpr std::size_t kDefaultMaxInflatedSize = 1024 * 1024;

// True when @p bytes start with a valid zlib header (CM = deflate, CINFO <= 7, FCHECK ok).
// A CBOR COSE_Sign1 item never starts with such a header.
bool LooksLikeZlibStream(std::span<const std::uint8_t> bytes);

// Inflates a complete zlib stream. Fails on corrupt or truncated data, or when the output
// would exceed @p max_output bytes.
bool ZlibInflate(std::span<const std::uint8_t> compressed,
                 std::vector<std::uint8_t>& out,
                 std::size_t max_output = kDefaultMaxInflatedSize,
                 std::string* out_error = nullptr);

bool ZlibDeflate(std::span<const std::uint8_t> bytes,
                 std::vector<std::uint8_t>& out,
                 int level = 9,
                 std::string* out_error = nullptr);

} // namespace hcert::common
