// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file certificate.h
 * @brief Typed health certificate record.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "hcert/decoder/cryptographic_envelope.h"

namespace hcert::decoder {

using Timestamp = std::chrono::sys_seconds;
using Date = std::chrono::year_month_day;

struct PersonName {
  std::optional<std::string> family_name;              // fn
  std::string standardised_family_name;                // fnt
  std::optional<std::string> given_name;               // gn
  std::optional<std::string> standardised_given_name;  // gnt

  bool operator==(const PersonName&) const = default;
};

struct VaccinationEntry {
  std::string disease_agent_targeted;          // tg
  std::string vaccine_or_prophylaxis;          // vp
  std::string medicinal_product;               // mp
  std::string marketing_authorisation_holder;  // ma
  std::int64_t dose_number = 0;                // dn
  std::int64_t total_series_of_doses = 0;      // sd
  Date date_of_vaccination{};                  // dt
  std::string country;                         // co
  std::string certificate_issuer;              // is
  std::string certificate_identifier;          // ci

  bool operator==(const VaccinationEntry&) const = default;
};

struct TestEntry {
  std::string disease_agent_targeted;                      // tg
  std::string type_of_test;                                // tt
  std::optional<std::string> naa_test_name;                // nm
  std::optional<std::string> rat_test_device_identifier;   // ma
  Timestamp sample_collected_at;                           // sc
  std::string test_result;                                 // tr
  std::optional<std::string> testing_centre;               // tc
  std::string country;                                     // co
  std::string certificate_issuer;                          // is
  std::string certificate_identifier;                      // ci

  bool operator==(const TestEntry&) const = default;
};

struct RecoveryEntry {
  std::string disease_agent_targeted;  // tg
  Date first_positive_test_result{};   // fr
  std::string country;                 // co
  std::string certificate_issuer;      // is
  Date valid_from{};                   // df
  Date valid_until{};                  // du
  std::string certificate_identifier;  // ci

  bool operator==(const RecoveryEntry&) const = default;
};

// Exactly one vaccination, test or recovery statement.
using CertificateContent = std::variant<VaccinationEntry, TestEntry, RecoveryEntry>;

/**
 * @brief The claims carried in the COSE payload, before they are bound to their envelope.
 */
struct CertificateClaims {
  std::string issuer;          // CWT 1
  Timestamp issued_at;         // CWT 6
  Timestamp expires_at;        // CWT 4
  std::string schema_version;  // ver
  std::string date_of_birth;   // dob: "", YYYY, YYYY-MM or YYYY-MM-DD
  PersonName name;             // nam
  CertificateContent content;  // v | t | r

  bool operator==(const CertificateClaims&) const = default;
};

/**
 * @brief A decoded health certificate.
 *
 * Immutable: the claims, the envelope they were signed in and the original text are bound
 * together at construction and only exposed through const accessors.
 */
class Certificate {
 public:
  Certificate(CertificateClaims claims, CryptographicEnvelope envelope, std::string text_representation);

  const CertificateClaims& claims() const { return claims_; }
  const std::string& issuer() const { return claims_.issuer; }
  Timestamp issued_at() const { return claims_.issued_at; }
  Timestamp expires_at() const { return claims_.expires_at; }
  const std::string& schema_version() const { return claims_.schema_version; }
  const std::string& date_of_birth() const { return claims_.date_of_birth; }
  const PersonName& name() const { return claims_.name; }
  const CertificateContent& content() const { return claims_.content; }

  const CryptographicEnvelope& envelope() const { return envelope_; }

  // The full input text as received, including the prefix when one was present.
  const std::string& text_representation() const { return text_representation_; }

  const VaccinationEntry* vaccination() const { return std::get_if<VaccinationEntry>(&claims_.content); }
  const TestEntry* test() const { return std::get_if<TestEntry>(&claims_.content); }
  const RecoveryEntry* recovery() const { return std::get_if<RecoveryEntry>(&claims_.content); }

 private:
  CertificateClaims claims_;
  CryptographicEnvelope envelope_;
  std::string text_representation_;
};

} // namespace hcert::decoder
