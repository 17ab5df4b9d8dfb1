// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_certificate_validator.cpp
 * @brief Validator results, including the full decode, verify and validate flow.
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include <hcert/decoder/hcert_decoder.h>

#include "hcert/validation/certificate_validator.h"
#include "hcert/validation/signature_verifier.h"
#include "test_utils.h"
#include "validation_test_support.h"
#include "wire_samples.h"

using namespace std::chrono;
using hcert::validation::CertificateValidator;
using hcert::validation::ValidationRule;

namespace {

const sys_seconds kNow = sys_days{2021y / July / 1d};

} // namespace

TEST_CASE("CertificateValidator succeeds with the default rule") {
  const auto cert = hcert::tests::CertificateFromClaims(hcert::tests::MakeClaims(hcert::tests::SampleVaccinationDcc()));
  const CertificateValidator validator("Policy", hcert::tests::FixedClock(kNow));

  const auto r = validator.Validate(cert);
  REQUIRE(r.is_valid);
  REQUIRE(r.validator_name == "Policy");
  REQUIRE(r.failures.empty());
  REQUIRE_FALSE(r.unsatisfied_rule().has_value());
}

TEST_CASE("CertificateValidator reports the unsatisfied rule") {
  auto dcc = hcert::tests::SampleVaccinationDcc();
  dcc["v"][0]["dn"] = 1;
  const auto cert = hcert::tests::CertificateFromClaims(hcert::tests::MakeClaims(dcc));
  const CertificateValidator validator("Policy", hcert::tests::FixedClock(kNow));

  const auto r = validator.Validate(cert);
  REQUIRE_FALSE(r.is_valid);
  REQUIRE(r.failures.size() == 1);
  REQUIRE(r.failures[0].error_code == hcert::validation::kRuleUnsatisfied);
  REQUIRE(r.failures[0].message == "Validation rule not satisfied: IsFullyImmunized");
  REQUIRE(r.unsatisfied_rule().has_value());
  REQUIRE(r.unsatisfied_rule()->tag() == "IsFullyImmunized");
}

TEST_CASE("CertificateValidator applies a caller-supplied rule") {
  const auto cert = hcert::tests::CertificateFromClaims(hcert::tests::MakeClaims(hcert::tests::SampleRecoveryDcc()));
  const CertificateValidator validator;

  const auto issued_in_at = ValidationRule::Leaf("IsIssuedInAustria", [](const hcert::decoder::Certificate& c) {
    return c.issuer() == "AT";
  });
  const auto not_a_test = !hcert::validation::rules::IsTest();

  REQUIRE(validator.Validate(cert, issued_in_at && not_a_test).is_valid);

  const auto vaccination_only = issued_in_at && hcert::validation::rules::IsVaccination();
  const auto r = validator.Validate(cert, vaccination_only);
  REQUIRE_FALSE(r.is_valid);
  REQUIRE(r.unsatisfied_rule()->tag() == "IsVaccination");
  REQUIRE(r.validator_name == "CertificateValidator");
}

TEST_CASE("A signed vaccination certificate decodes, verifies and validates") {
  const auto signed_cert =
      hcert::tests::MakeSignedCertificate(hcert::tests::MakeClaims(hcert::tests::SampleVaccinationDcc()));

  const auto decoded = hcert::decoder::HcertDecoder().Decode(signed_cert.text);
  REQUIRE(decoded.is_valid);
  const auto& cert = *decoded.certificate;

  REQUIRE(cert.issuer() == "AT");
  REQUIRE(cert.schema_version() == "1.3.0");
  REQUIRE(cert.envelope().signature().size() == 64);
  REQUIRE(cert.text_representation() == signed_cert.text);

  hcert::validation::VerifyOptions options;
  options.public_key_bytes = signed_cert.public_key_der;
  options.expected_alg = hcert::validation::CoseAlgorithm::ES256;
  const auto signature = hcert::validation::VerifyCertificateSignature(cert.envelope(), options);
  REQUIRE(signature.is_valid);

  const auto policy = CertificateValidator("Policy", hcert::tests::FixedClock(kNow)).Validate(cert);
  REQUIRE(policy.is_valid);
}

TEST_CASE("The default rule accepts the fixed samples inside their validity") {
  const hcert::decoder::HcertDecoder decoder;

  const auto vaccination = decoder.Decode(hcert::tests::kVaccinationSampleText);
  REQUIRE(vaccination.is_valid);
  REQUIRE(vaccination.certificate->issuer() == "AT");
  REQUIRE(vaccination.certificate->schema_version() == "1.0.0");
  REQUIRE(vaccination.certificate->envelope().signature().size() == 64);
  REQUIRE(CertificateValidator("Policy", hcert::tests::FixedClock(kNow)).Validate(*vaccination.certificate).is_valid);

  const auto before_issue = CertificateValidator("Policy", hcert::tests::FixedClock(sys_days{2021y / June / 1d}))
                                .Validate(*vaccination.certificate);
  REQUIRE(before_issue.unsatisfied_rule()->tag() == "IsIssuedInPast");

  const auto test = decoder.Decode(hcert::tests::kTestSampleText);
  REQUIRE(test.is_valid);
  REQUIRE(CertificateValidator("Policy", hcert::tests::FixedClock(sys_days{2021y / June / 2d})).Validate(*test.certificate).is_valid);

  const auto stale = CertificateValidator("Policy", hcert::tests::FixedClock(sys_days{2021y / June / 4d}))
                         .Validate(*test.certificate);
  REQUIRE(stale.unsatisfied_rule()->tag() == "IsTestValid");
}
