// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <tinycbor/cbor.h>

#include <hcert/common/cbor_primitives.h>

namespace cbor = hcert::common::cbor;

namespace {

// {1: -7, 4: h'0102', "x": 5}
const std::vector<std::uint8_t> kHeaderMap = {0xA3, 0x01, 0x26, 0x04, 0x42, 0x01, 0x02, 0x61, 0x78, 0x05};

CborValue Parse(const std::vector<std::uint8_t>& bytes, CborParser& parser) {
  CborValue it;
  REQUIRE(cbor_parser_init(bytes.data(), bytes.size(), 0, &parser, &it) == CborNoError);
  return it;
}

} // namespace

TEST_CASE("TryReadInt64FromMap finds integer labels and skips text keys") {
  CborParser parser;
  const CborValue map = Parse(kHeaderMap, parser);

  std::optional<std::int64_t> alg;
  REQUIRE(cbor::TryReadInt64FromMap(map, 1, alg));
  REQUIRE(alg == -7);

  std::optional<std::int64_t> missing;
  REQUIRE(cbor::TryReadInt64FromMap(map, 3, missing));
  REQUIRE_FALSE(missing.has_value());

  // Label 4 holds a byte string, not an integer.
  std::optional<std::int64_t> kid_as_int;
  REQUIRE(cbor::TryReadInt64FromMap(map, 4, kid_as_int));
  REQUIRE_FALSE(kid_as_int.has_value());
}

TEST_CASE("TryReadByteStringFromMap reads byte string values") {
  CborParser parser;
  const CborValue map = Parse(kHeaderMap, parser);

  std::optional<std::vector<std::uint8_t>> kid;
  REQUIRE(cbor::TryReadByteStringFromMap(map, 4, kid));
  REQUIRE(kid == std::vector<std::uint8_t>{0x01, 0x02});

  std::optional<std::vector<std::uint8_t>> alg_as_bytes;
  REQUIRE(cbor::TryReadByteStringFromMap(map, 1, alg_as_bytes));
  REQUIRE_FALSE(alg_as_bytes.has_value());
}

TEST_CASE("Map readers reject non-map items") {
  const std::vector<std::uint8_t> array = {0x81, 0x01};
  CborParser parser;
  const CborValue value = Parse(array, parser);

  std::optional<std::int64_t> i;
  std::optional<std::vector<std::uint8_t>> b;
  REQUIRE_FALSE(cbor::TryReadInt64FromMap(value, 1, i));
  REQUIRE_FALSE(cbor::TryReadByteStringFromMap(value, 1, b));
}

TEST_CASE("CopyRawCborItemBytes copies exactly one encoded item") {
  // [1, "ab", {2: 3}]
  const std::vector<std::uint8_t> bytes = {0x83, 0x01, 0x62, 0x61, 0x62, 0xA1, 0x02, 0x03};
  CborParser parser;
  CborValue array = Parse(bytes, parser);

  CborValue it;
  REQUIRE(cbor_value_enter_container(&array, &it) == CborNoError);
  REQUIRE(cbor_value_advance(&it) == CborNoError);

  std::vector<std::uint8_t> raw;
  REQUIRE(cbor::CopyRawCborItemBytes(it, raw));
  REQUIRE(raw == std::vector<std::uint8_t>{0x62, 0x61, 0x62});

  REQUIRE(cbor_value_advance(&it) == CborNoError);
  REQUIRE(cbor::CopyRawCborItemBytes(it, raw));
  REQUIRE(raw == std::vector<std::uint8_t>{0xA1, 0x02, 0x03});
}

TEST_CASE("ReadByteString and ReadTextString check the major type") {
  // ["hi", h'00']
  const std::vector<std::uint8_t> bytes = {0x82, 0x62, 0x68, 0x69, 0x41, 0x00};
  CborParser parser;
  CborValue array = Parse(bytes, parser);

  CborValue it;
  REQUIRE(cbor_value_enter_container(&array, &it) == CborNoError);

  std::vector<std::uint8_t> b;
  REQUIRE_FALSE(cbor::ReadByteString(&it, b));

  std::string s;
  REQUIRE(cbor::ReadTextString(&it, s));
  REQUIRE(s == "hi");

  REQUIRE_FALSE(cbor::ReadTextString(&it, s));
  REQUIRE(cbor::ReadByteString(&it, b));
  REQUIRE(b == std::vector<std::uint8_t>{0x00});
  REQUIRE(cbor_value_at_end(&it));
}

TEST_CASE("DecodeSingleItem distinguishes empty input from malformed input") {
  CborParser parser;
  CborValue item;
  std::string error;

  REQUIRE(cbor::DecodeSingleItem({}, parser, item, &error) == cbor::ItemDecodeStatus::kNoItem);

  // Array of two with only one element present.
  const std::vector<std::uint8_t> truncated = {0x82, 0x01};
  REQUIRE(cbor::DecodeSingleItem(truncated, parser, item, &error) == cbor::ItemDecodeStatus::kError);
  REQUIRE_FALSE(error.empty());

  const std::vector<std::uint8_t> ok = {0xA1, 0x01, 0x02};
  REQUIRE(cbor::DecodeSingleItem(ok, parser, item, &error) == cbor::ItemDecodeStatus::kDecoded);
  REQUIRE(error.empty());
  REQUIRE(cbor_value_is_map(&item));
}
