// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

#include "../src/internal/openssl_utils.h"
#include "test_utils.h"

TEST_CASE("CoseEcdsaRawToDer rejects malformed raw signatures") {
  REQUIRE_FALSE(hcert::internal::CoseEcdsaRawToDer({}).has_value());

  const std::vector<std::uint8_t> odd(63, 0x01);
  REQUIRE_FALSE(hcert::internal::CoseEcdsaRawToDer(odd).has_value());

  const std::vector<std::uint8_t> raw(64, 0x01);
  const auto der = hcert::internal::CoseEcdsaRawToDer(raw);
  REQUIRE(der.has_value());
  // SEQUENCE of two INTEGERs.
  REQUIRE(der->front() == 0x30);
}

TEST_CASE("LoadPublicKeyOrCertFromDer accepts exactly one SubjectPublicKeyInfo") {
  auto key = hcert::tests::GenerateEcP256Key();
  auto der = hcert::tests::PublicKeyDerFromKey(key.get());

  REQUIRE(hcert::internal::LoadPublicKeyOrCertFromDer(der) != nullptr);
  REQUIRE(hcert::internal::LoadPublicKeyOrCertFromDer({}) == nullptr);

  der.push_back(0x00);
  REQUIRE(hcert::internal::LoadPublicKeyOrCertFromDer(der) == nullptr);
}

TEST_CASE("LoadPublicKeyOrCertFromPem round-trips through EncodePublicKeyDer") {
  auto key = hcert::tests::GenerateRsaKey(2048);
  const auto pem = hcert::tests::PublicKeyPemFromKey(key.get());

  auto loaded = hcert::internal::LoadPublicKeyOrCertFromPem(pem);
  REQUIRE(loaded != nullptr);

  const auto der = hcert::internal::EncodePublicKeyDer(loaded.get());
  REQUIRE(der.has_value());
  REQUIRE(*der == hcert::tests::PublicKeyDerFromKey(key.get()));

  REQUIRE(hcert::internal::LoadPublicKeyOrCertFromPem("-----BEGIN PUBLIC KEY-----\n-----END PUBLIC KEY-----\n") == nullptr);
  REQUIRE_FALSE(hcert::internal::EncodePublicKeyDer(nullptr).has_value());
}

TEST_CASE("VerifyEs256 requires a 64-byte raw signature") {
  auto key = hcert::tests::GenerateEcP256Key();
  const std::vector<std::uint8_t> message = {0x01, 0x02, 0x03};

  auto sig = hcert::tests::SignEs256ToCoseRaw(key.get(), message);
  REQUIRE(sig.size() == 64);
  REQUIRE(hcert::internal::VerifyEs256(key.get(), message, sig));

  sig.push_back(0x00);
  REQUIRE_FALSE(hcert::internal::VerifyEs256(key.get(), message, sig));
}
