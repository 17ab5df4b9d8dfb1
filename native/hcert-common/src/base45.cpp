// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/common/base45.h"

#include <array>
#include <cstddef>
#include <utility>

namespace hcert::common {

namespace {

constexpr std::string_view kAlphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./:";
constexpr std::uint32_t kBase = 45;

constexpr std::array<std::int8_t, 256> MakeReverseTable() {
  std::array<std::int8_t, 256> table{};
  for (auto& v : table) {
    v = -1;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
  }
  return table;
}

constexpr std::array<std::int8_t, 256> kReverse = MakeReverseTable();

bool Fail(std::string* out_error, std::string message) {
  if (out_error) *out_error = std::move(message);
  return false;
}

} // namespace

bool Base45Decode(std::string_view text, std::vector<std::uint8_t>& out, std::string* out_error) {
  if (out_error) out_error->clear();
  out.clear();

  if (text.size() % 3 == 1) {
    return Fail(out_error, "invalid Base45 length " + std::to_string(text.size()));
  }

  out.reserve((text.size() / 3) * 2 + 1);

  std::size_t i = 0;
  while (i < text.size()) {
    const std::size_t group = (text.size() - i >= 3) ? 3 : 2;

    std::uint32_t value = 0;
    std::uint32_t weight = 1;
    for (std::size_t k = 0; k < group; ++k) {
      const std::int8_t digit = kReverse[static_cast<unsigned char>(text[i + k])];
      if (digit < 0) {
        return Fail(out_error, "invalid Base45 character at offset " + std::to_string(i + k));
      }
      value += static_cast<std::uint32_t>(digit) * weight;
      weight *= kBase;
    }

    if (group == 3) {
      if (value > 0xFFFF) {
        return Fail(out_error, "Base45 triplet out of range at offset " + std::to_string(i));
      }
      out.push_back(static_cast<std::uint8_t>(value >> 8));
      out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    } else {
      if (value > 0xFF) {
        return Fail(out_error, "Base45 pair out of range at offset " + std::to_string(i));
      }
      out.push_back(static_cast<std::uint8_t>(value));
    }

    i += group;
  }

  return true;
}

std::string Base45Encode(std::span<const std::uint8_t> bytes) {
  std::string out;
  out.reserve((bytes.size() / 2) * 3 + 2);

  std::size_t i = 0;
  for (; i + 1 < bytes.size(); i += 2) {
    std::uint32_t value = (static_cast<std::uint32_t>(bytes[i]) << 8) | bytes[i + 1];
    for (int k = 0; k < 3; ++k) {
      out.push_back(kAlphabet[value % kBase]);
      value /= kBase;
    }
  }

  if (i < bytes.size()) {
    std::uint32_t value = bytes[i];
    out.push_back(kAlphabet[value % kBase]);
    out.push_back(kAlphabet[value / kBase]);
  }

  return out;
}

} // namespace hcert::common
