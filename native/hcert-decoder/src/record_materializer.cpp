// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file record_materializer.cpp
 * @brief CBOR claims map -> JSON document -> CertificateClaims.
 */

#include "hcert/decoder/record_materializer.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "internal/cbor_json.h"
#include "internal/date_parsing.h"

namespace hcert::decoder {

namespace {

using nlohmann::json;

// CWT claim keys as rendered by the CBOR -> JSON conversion.
constexpr const char* kClaimIssuer = "1";
constexpr const char* kClaimExpiresAt = "4";
constexpr const char* kClaimIssuedAt = "6";
constexpr const char* kClaimHcert = "-260";
constexpr const char* kHcertEuDcc = "1";

class SchemaReader final {
 public:
  explicit SchemaReader(const SchemaOptions& options) : options_(options) {}

  CertificateClaims Read(const json& document) const {
    RequireObject(document, "$");

    CertificateClaims claims;
    claims.issuer = RequireString(document, kClaimIssuer, "$");
    claims.expires_at = RequireTimestamp(document, kClaimExpiresAt, "$");
    claims.issued_at = RequireTimestamp(document, kClaimIssuedAt, "$");

    const json& hcert = RequireMember(document, kClaimHcert, "$");
    RequireObject(hcert, "$.-260");
    const json& dcc = RequireMember(hcert, kHcertEuDcc, "$.-260");
    const std::string path = "$.-260.1";
    RequireObject(dcc, path);

    claims.schema_version = RequireString(dcc, "ver", path);

    claims.date_of_birth = RequireString(dcc, "dob", path);
    if (!internal::IsValidDateOfBirth(claims.date_of_birth)) {
      throw std::invalid_argument(path + ".dob: malformed date of birth");
    }

    claims.name = ReadName(RequireMember(dcc, "nam", path), path + ".nam");
    claims.content = ReadContent(dcc, path);
    return claims;
  }

 private:
  static void RequireObject(const json& value, const std::string& path) {
    if (!value.is_object()) {
      throw std::invalid_argument(path + ": expected an object");
    }
  }

  static const json& RequireMember(const json& object, const char* key, const std::string& path) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
      throw std::invalid_argument(path + "." + key + ": missing required field");
    }
    return *it;
  }

  static std::string RequireString(const json& object, const char* key, const std::string& path) {
    const json& value = RequireMember(object, key, path);
    if (!value.is_string()) {
      throw std::invalid_argument(path + "." + key + ": expected a string");
    }
    return value.get<std::string>();
  }

  static std::optional<std::string> OptionalString(const json& object, const char* key, const std::string& path) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
      return std::nullopt;
    }
    if (!it->is_string()) {
      throw std::invalid_argument(path + "." + key + ": expected a string");
    }
    return it->get<std::string>();
  }

  // Strings inside content entries; relaxed when strict field presence is off.
  std::string EntryString(const json& object, const char* key, const std::string& path) const {
    if (!options_.strict_field_presence) {
      return OptionalString(object, key, path).value_or(std::string());
    }
    return RequireString(object, key, path);
  }

  static std::int64_t RequirePositiveInteger(const json& object, const char* key, const std::string& path) {
    const json& value = RequireMember(object, key, path);
    if (!value.is_number_integer()) {
      throw std::invalid_argument(path + "." + key + ": expected an integer");
    }
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw std::invalid_argument(path + "." + key + ": integer out of range");
    }
    const auto n = value.get<std::int64_t>();
    if (n < 1) {
      throw std::invalid_argument(path + "." + key + ": expected a positive integer");
    }
    return n;
  }

  static Timestamp RequireTimestamp(const json& object, const char* key, const std::string& path) {
    const json& value = RequireMember(object, key, path);
    if (value.is_number_unsigned()) {
      const auto u = value.get<std::uint64_t>();
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw std::invalid_argument(path + "." + key + ": timestamp out of range");
      }
      return Timestamp{std::chrono::seconds{static_cast<std::int64_t>(u)}};
    }
    if (value.is_number_integer()) {
      return Timestamp{std::chrono::seconds{value.get<std::int64_t>()}};
    }
    if (value.is_number_float()) {
      const double d = std::floor(value.get<double>());
      if (d < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
          d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        throw std::invalid_argument(path + "." + key + ": timestamp out of range");
      }
      return Timestamp{std::chrono::seconds{static_cast<std::int64_t>(d)}};
    }
    throw std::invalid_argument(path + "." + key + ": expected a numeric timestamp");
  }

  static Date RequireDate(const json& object, const char* key, const std::string& path) {
    const std::string text = RequireString(object, key, path);
    Date date{};
    if (!internal::ParseDate(text, date)) {
      throw std::invalid_argument(path + "." + key + ": malformed date '" + text + "'");
    }
    return date;
  }

  static Timestamp RequireDateTime(const json& object, const char* key, const std::string& path) {
    const std::string text = RequireString(object, key, path);
    Timestamp ts;
    if (!internal::ParseDateTime(text, ts)) {
      throw std::invalid_argument(path + "." + key + ": malformed date-time '" + text + "'");
    }
    return ts;
  }

  static PersonName ReadName(const json& nam, const std::string& path) {
    RequireObject(nam, path);

    PersonName name;
    name.family_name = OptionalString(nam, "fn", path);
    name.standardised_family_name = RequireString(nam, "fnt", path);
    name.given_name = OptionalString(nam, "gn", path);
    name.standardised_given_name = OptionalString(nam, "gnt", path);
    return name;
  }

  VaccinationEntry ReadVaccination(const json& v, const std::string& path) const {
    VaccinationEntry e;
    e.disease_agent_targeted = EntryString(v, "tg", path);
    e.vaccine_or_prophylaxis = EntryString(v, "vp", path);
    e.medicinal_product = EntryString(v, "mp", path);
    e.marketing_authorisation_holder = EntryString(v, "ma", path);
    e.dose_number = RequirePositiveInteger(v, "dn", path);
    e.total_series_of_doses = RequirePositiveInteger(v, "sd", path);
    e.date_of_vaccination = RequireDate(v, "dt", path);
    e.country = EntryString(v, "co", path);
    e.certificate_issuer = EntryString(v, "is", path);
    e.certificate_identifier = EntryString(v, "ci", path);
    return e;
  }

  TestEntry ReadTest(const json& t, const std::string& path) const {
    TestEntry e;
    e.disease_agent_targeted = EntryString(t, "tg", path);
    e.type_of_test = EntryString(t, "tt", path);
    e.naa_test_name = OptionalString(t, "nm", path);
    e.rat_test_device_identifier = OptionalString(t, "ma", path);
    e.sample_collected_at = RequireDateTime(t, "sc", path);
    e.test_result = EntryString(t, "tr", path);
    e.testing_centre = OptionalString(t, "tc", path);
    e.country = EntryString(t, "co", path);
    e.certificate_issuer = EntryString(t, "is", path);
    e.certificate_identifier = EntryString(t, "ci", path);
    return e;
  }

  RecoveryEntry ReadRecovery(const json& r, const std::string& path) const {
    RecoveryEntry e;
    e.disease_agent_targeted = EntryString(r, "tg", path);
    e.first_positive_test_result = RequireDate(r, "fr", path);
    e.country = EntryString(r, "co", path);
    e.certificate_issuer = EntryString(r, "is", path);
    e.valid_from = RequireDate(r, "df", path);
    e.valid_until = RequireDate(r, "du", path);
    e.certificate_identifier = EntryString(r, "ci", path);
    return e;
  }

  CertificateContent ReadContent(const json& dcc, const std::string& path) const {
    const char* present = nullptr;
    for (const char* key : {"v", "t", "r"}) {
      const auto it = dcc.find(key);
      if (it == dcc.end() || it->is_null()) {
        continue;
      }
      if (present) {
        throw std::invalid_argument(path + ": more than one of 'v', 't', 'r' present");
      }
      present = key;
    }

    if (!present) {
      throw std::invalid_argument(path + ": missing required content, one of 'v', 't', 'r'");
    }

    const json& entries = dcc.at(present);
    const std::string entries_path = path + "." + present;
    if (!entries.is_array() || entries.size() != 1) {
      throw std::invalid_argument(entries_path + ": expected an array with exactly one entry");
    }

    const json& entry = entries.front();
    const std::string entry_path = entries_path + "[0]";
    RequireObject(entry, entry_path);

    switch (present[0]) {
      case 'v':
        return ReadVaccination(entry, entry_path);
      case 't':
        return ReadTest(entry, entry_path);
      default:
        return ReadRecovery(entry, entry_path);
    }
  }

  const SchemaOptions& options_;
};

bool Fail(MaterializationError* out_error, MaterializationError::Kind kind, std::optional<std::string> cause) {
  if (out_error) {
    out_error->kind = kind;
    out_error->cause = std::move(cause);
  }
  return false;
}

} // namespace

CertificateClaims ParseClaims(const nlohmann::json& document, const SchemaOptions& options) {
  return SchemaReader(options).Read(document);
}

bool MaterializeClaims(CborValue value, const SchemaOptions& options, CertificateClaims& out, MaterializationError* out_error) {
  using Kind = MaterializationError::Kind;

  if (!cbor_value_is_map(&value)) {
    return Fail(out_error, Kind::kPayloadConversion, std::nullopt);
  }

  json tree;
  std::string conversion_error;
  if (!internal::CborToJson(&value, tree, &conversion_error)) {
    return Fail(out_error, Kind::kPayloadConversion, conversion_error);
  }

  // Round-trip through JSON text: this is where text strings that are not valid UTF-8 surface.
  json document;
  try {
    document = json::parse(tree.dump());
  } catch (const json::exception& e) {
    return Fail(out_error, Kind::kPayloadConversion, std::string(e.what()));
  }

  try {
    out = ParseClaims(document, options);
  } catch (const std::invalid_argument& e) {
    return Fail(out_error, Kind::kSchemaDecoding, std::string(e.what()));
  } catch (const json::exception& e) {
    return Fail(out_error, Kind::kSchemaDecoding, std::string(e.what()));
  }

  return true;
}

} // namespace hcert::decoder
