// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <hcert/common/compression.h>

namespace {

std::vector<std::uint8_t> SamplePayload() {
  std::vector<std::uint8_t> data;
  for (int i = 0; i < 4096; ++i) {
    data.push_back(static_cast<std::uint8_t>(i % 17));
  }
  return data;
}

} // namespace

TEST_CASE("ZlibDeflate output is recognized and inflates back") {
  const auto data = SamplePayload();

  std::vector<std::uint8_t> compressed;
  REQUIRE(hcert::common::ZlibDeflate(data, compressed));
  REQUIRE(hcert::common::LooksLikeZlibStream(compressed));

  std::vector<std::uint8_t> inflated;
  std::string error;
  REQUIRE(hcert::common::ZlibInflate(compressed, inflated, hcert::common::kDefaultMaxInflatedSize, &error));
  REQUIRE(error.empty());
  REQUIRE(inflated == data);
}

TEST_CASE("LooksLikeZlibStream rejects COSE_Sign1 leading bytes") {
  // Tag 18 and an untagged 4-element array.
  const std::vector<std::uint8_t> tagged = {0xD2, 0x84, 0x43};
  const std::vector<std::uint8_t> untagged = {0x84, 0x43, 0xA1};
  REQUIRE_FALSE(hcert::common::LooksLikeZlibStream(tagged));
  REQUIRE_FALSE(hcert::common::LooksLikeZlibStream(untagged));

  const std::vector<std::uint8_t> one_byte = {0x78};
  REQUIRE_FALSE(hcert::common::LooksLikeZlibStream(one_byte));
}

TEST_CASE("LooksLikeZlibStream accepts the common zlib headers") {
  for (std::uint8_t flg : {0x01, 0x5E, 0x9C, 0xDA}) {
    const std::vector<std::uint8_t> header = {0x78, flg};
    REQUIRE(hcert::common::LooksLikeZlibStream(header));
  }
}

TEST_CASE("ZlibInflate rejects truncated streams") {
  std::vector<std::uint8_t> compressed;
  REQUIRE(hcert::common::ZlibDeflate(SamplePayload(), compressed));
  compressed.resize(compressed.size() / 2);

  std::vector<std::uint8_t> out;
  std::string error;
  REQUIRE_FALSE(hcert::common::ZlibInflate(compressed, out, hcert::common::kDefaultMaxInflatedSize, &error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("ZlibInflate rejects corrupt data after a valid header") {
  const std::vector<std::uint8_t> corrupt = {0x78, 0xDA, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

  std::vector<std::uint8_t> out;
  std::string error;
  REQUIRE_FALSE(hcert::common::ZlibInflate(corrupt, out, hcert::common::kDefaultMaxInflatedSize, &error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("ZlibInflate enforces the output limit") {
  const std::vector<std::uint8_t> zeros(64 * 1024, 0);
  std::vector<std::uint8_t> compressed;
  REQUIRE(hcert::common::ZlibDeflate(zeros, compressed));

  std::vector<std::uint8_t> out;
  std::string error;
  REQUIRE_FALSE(hcert::common::ZlibInflate(compressed, out, 1024, &error));
  REQUIRE(error.find("exceeds limit") != std::string::npos);

  REQUIRE(hcert::common::ZlibInflate(compressed, out, zeros.size()));
  REQUIRE(out == zeros);
}
