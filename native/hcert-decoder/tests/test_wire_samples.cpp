// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_wire_samples.cpp
 * @brief Decoding fixed certificates whose bytes are written out by hand.
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "hcert/decoder/hcert_decoder.h"
#include "test_utils.h"
#include "wire_samples.h"

using namespace std::chrono;
using hcert::decoder::HcertDecoder;
using hcert::tests::FromHex;

namespace {

std::vector<std::uint8_t> SampleSignature() {
  std::vector<std::uint8_t> sig;
  for (std::uint8_t b = 0x20; b < 0x60; ++b) {
    sig.push_back(b);
  }
  return sig;
}

} // namespace

TEST_CASE("FromHex skips whitespace and rejects bad digits") {
  REQUIRE(FromHex("a0 0F\n10") == std::vector<std::uint8_t>{0xA0, 0x0F, 0x10});
  REQUIRE_THROWS_AS(FromHex("abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(FromHex("zz"), std::invalid_argument);
}

TEST_CASE("Decode reads the vaccination sample") {
  const auto r = HcertDecoder().Decode(hcert::tests::kVaccinationSampleText);
  REQUIRE(r.is_valid);
  const auto& cert = *r.certificate;

  REQUIRE(cert.text_representation() == hcert::tests::kVaccinationSampleText);
  REQUIRE(cert.issuer() == "AT");
  REQUIRE(cert.schema_version() == "1.0.0");
  REQUIRE(cert.issued_at() == sys_seconds{seconds{1622548800}});
  REQUIRE(cert.expires_at() == sys_seconds{seconds{1654084800}});
  REQUIRE(cert.date_of_birth() == "1998-02-26");

  REQUIRE(cert.name().family_name == "Musterfrau-G\xC3\xB6\xC3\x9Finger");
  REQUIRE(cert.name().standardised_family_name == "MUSTERFRAU<GOESSINGER");
  REQUIRE(cert.name().given_name == "Gabriele");
  REQUIRE(cert.name().standardised_given_name == "GABRIELE");

  const auto* v = cert.vaccination();
  REQUIRE(v != nullptr);
  REQUIRE(v->disease_agent_targeted == "840539006");
  REQUIRE(v->vaccine_or_prophylaxis == "1119349007");
  REQUIRE(v->medicinal_product == "EU/1/20/1528");
  REQUIRE(v->marketing_authorisation_holder == "ORG-100030215");
  REQUIRE(v->dose_number == 2);
  REQUIRE(v->total_series_of_doses == 2);
  REQUIRE(v->date_of_vaccination == year_month_day{2021y / February / 18d});
  REQUIRE(v->country == "AT");
  REQUIRE(v->certificate_issuer == "Ministry of Health, Austria");
  REQUIRE(v->certificate_identifier == "URN:UVCI:01:AT:10807843F94AEE0EE5093FBC254BD813#B");

  const auto& envelope = cert.envelope();
  REQUIRE(envelope.protected_header() == FromHex(hcert::tests::kVaccinationSampleProtectedHex));
  REQUIRE(envelope.unprotected_header().empty());
  REQUIRE(envelope.payload() == FromHex(hcert::tests::kVaccinationSamplePayloadHex));
  REQUIRE(envelope.signature() == SampleSignature());
  REQUIRE(envelope.Algorithm() == -7);
  REQUIRE(envelope.KeyId() == FromHex(hcert::tests::kSampleKeyIdHex));
}

TEST_CASE("Decode reads the test sample") {
  const auto r = HcertDecoder().Decode(hcert::tests::kTestSampleText);
  REQUIRE(r.is_valid);
  const auto& cert = *r.certificate;

  REQUIRE(cert.issuer() == "DE");
  REQUIRE(cert.schema_version() == "1.3.0");
  REQUIRE(cert.date_of_birth() == "1964-08");
  REQUIRE(cert.name().family_name == "Mustermann");
  REQUIRE(cert.name().standardised_family_name == "MUSTERMANN");
  REQUIRE_FALSE(cert.name().given_name.has_value());
  REQUIRE_FALSE(cert.name().standardised_given_name.has_value());

  const auto* t = cert.test();
  REQUIRE(t != nullptr);
  REQUIRE(t->type_of_test == "LP217198-3");
  REQUIRE(t->naa_test_name == "SARS-CoV-2 Rapid Test");
  REQUIRE(t->rat_test_device_identifier == "1232");
  REQUIRE(t->testing_centre == "Testzentrum Koeln Hbf");
  REQUIRE(t->test_result == "260415000");
  REQUIRE(t->certificate_issuer == "Robert Koch-Institut");
  // 2021-06-01T10:27:15+02:00
  REQUIRE(t->sample_collected_at == sys_days{2021y / June / 1d} + 8h + 27min + 15s);

  const auto& envelope = cert.envelope();
  REQUIRE(envelope.protected_header() == FromHex(hcert::tests::kTestSampleProtectedHex));
  REQUIRE(envelope.unprotected_header().size() == 1);
  REQUIRE(envelope.payload() == FromHex(hcert::tests::kTestSamplePayloadHex));
  REQUIRE(envelope.signature().size() == 64);
  REQUIRE(envelope.Algorithm() == -7);
  REQUIRE(envelope.KeyId() == FromHex(hcert::tests::kSampleKeyIdHex));
}

TEST_CASE("Decode of the samples is prefix independent") {
  const std::string text = hcert::tests::kTestSampleText;
  const auto with_prefix = HcertDecoder().Decode(text);
  const auto without_prefix = HcertDecoder().Decode(text.substr(4));

  REQUIRE(with_prefix.is_valid);
  REQUIRE(without_prefix.is_valid);
  REQUIRE(with_prefix.certificate->claims() == without_prefix.certificate->claims());
  REQUIRE(without_prefix.certificate->text_representation() == text.substr(4));
}
