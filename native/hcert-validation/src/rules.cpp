// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/validation/rules.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>
#include <variant>

namespace hcert::validation::rules {

namespace {

using hcert::decoder::RecoveryEntry;
using hcert::decoder::TestEntry;
using hcert::decoder::VaccinationEntry;

constexpr std::array<std::string_view, 4> kWellKnownVaccineProducts = {
    "EU/1/20/1528", // Comirnaty
    "EU/1/20/1507", // Spikevax
    "EU/1/21/1529", // Vaxzevria
    "EU/1/20/1525", // COVID-19 Vaccine Janssen
};

std::chrono::sys_days Today(const Clock& clock) {
  return std::chrono::floor<std::chrono::days>(clock());
}

} // namespace

Clock SystemClock() {
  return [] { return std::chrono::system_clock::now(); };
}

ValidationRule IsVaccination() {
  return ValidationRule::Leaf("IsVaccination", [](const Certificate& c) { return c.vaccination() != nullptr; });
}

ValidationRule IsTest() {
  return ValidationRule::Leaf("IsTest", [](const Certificate& c) { return c.test() != nullptr; });
}

ValidationRule IsRecovery() {
  return ValidationRule::Leaf("IsRecovery", [](const Certificate& c) { return c.recovery() != nullptr; });
}

ValidationRule IsIssuedInPast(Clock clock) {
  return ValidationRule::Leaf("IsIssuedInPast", [clock = std::move(clock)](const Certificate& c) {
    return c.issued_at() <= clock();
  });
}

ValidationRule IsNotExpired(Clock clock) {
  return ValidationRule::Leaf("IsNotExpired", [clock = std::move(clock)](const Certificate& c) {
    return clock() < c.expires_at();
  });
}

ValidationRule IsTargetingCovid19() {
  return ValidationRule::Leaf("IsTargetingCovid19", [](const Certificate& c) {
    return std::visit([](const auto& entry) { return entry.disease_agent_targeted == kCovid19DiseaseAgent; },
                      c.content());
  });
}

ValidationRule IsFullyImmunized() {
  return ValidationRule::Leaf("IsFullyImmunized", [](const Certificate& c) {
    const VaccinationEntry* v = c.vaccination();
    return v && v->dose_number >= v->total_series_of_doses;
  });
}

ValidationRule IsWellKnownVaccineMedicinalProduct() {
  return ValidationRule::Leaf("IsWellKnownVaccineMedicinalProduct", [](const Certificate& c) {
    const VaccinationEntry* v = c.vaccination();
    return v && std::find(kWellKnownVaccineProducts.begin(), kWellKnownVaccineProducts.end(), v->medicinal_product) !=
                    kWellKnownVaccineProducts.end();
  });
}

ValidationRule IsVaccinationInEffect(std::chrono::days waiting_period, Clock clock) {
  return ValidationRule::Leaf("IsVaccinationInEffect", [waiting_period, clock = std::move(clock)](const Certificate& c) {
    const VaccinationEntry* v = c.vaccination();
    if (!v || !v->date_of_vaccination.ok()) {
      return false;
    }
    return std::chrono::sys_days(v->date_of_vaccination) + waiting_period <= Today(clock);
  });
}

ValidationRule IsTestedNegative() {
  return ValidationRule::Leaf("IsTestedNegative", [](const Certificate& c) {
    const TestEntry* t = c.test();
    return t && t->test_result == kTestResultNotDetected;
  });
}

ValidationRule IsTestValid(Clock clock) {
  return ValidationRule::Leaf("IsTestValid", [clock = std::move(clock)](const Certificate& c) {
    const TestEntry* t = c.test();
    if (!t) {
      return false;
    }
    std::chrono::hours validity{0};
    if (t->type_of_test == kTestTypeNaa) {
      validity = kNaaTestValidity;
    } else if (t->type_of_test == kTestTypeRat) {
      validity = kRatTestValidity;
    } else {
      return false;
    }
    return clock() <= t->sample_collected_at + validity;
  });
}

ValidationRule IsRecoveryValid(Clock clock) {
  return ValidationRule::Leaf("IsRecoveryValid", [clock = std::move(clock)](const Certificate& c) {
    const RecoveryEntry* r = c.recovery();
    if (!r || !r->valid_from.ok() || !r->valid_until.ok()) {
      return false;
    }
    const auto today = Today(clock);
    return std::chrono::sys_days(r->valid_from) <= today && today <= std::chrono::sys_days(r->valid_until);
  });
}

ValidationRule Default(Clock clock) {
  return IsIssuedInPast(clock) && IsNotExpired(clock) &&
         (!IsVaccination() || (IsFullyImmunized() && IsWellKnownVaccineMedicinalProduct())) &&
         (!IsTest() || (IsTestedNegative() && IsTestValid(clock))) &&
         (!IsRecovery() || IsRecoveryValid(clock));
}

} // namespace hcert::validation::rules
