// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file rules.h
 * @brief Predefined certificate rules.
 *
 * Rules that depend on the current time take a Clock so tests can pin "now". Dates without
 * a time of day (vaccination date, recovery validity) are compared against the UTC calendar
 * day of the clock's reading.
 */

#include <chrono>
#include <functional>

#include "hcert/validation/validation_rule.h"

namespace hcert::validation::rules {

using Clock = std::function<std::chrono::system_clock::time_point()>;

Clock SystemClock();

// SNOMED CT code for COVID-19.
inline constexpr const char* kCovid19DiseaseAgent = "840539006";
// SNOMED CT code for "Not detected".
inline constexpr const char* kTestResultNotDetected = "260415000";
inline constexpr const char* kTestTypeNaa = "LP6464-4";
inline constexpr const char* kTestTypeRat = "LP217198-3";

inline constexpr std::chrono::hours kNaaTestValidity{72};
inline constexpr std::chrono::hours kRatTestValidity{48};

ValidationRule IsVaccination();
ValidationRule IsTest();
ValidationRule IsRecovery();

ValidationRule IsIssuedInPast(Clock clock = SystemClock());
ValidationRule IsNotExpired(Clock clock = SystemClock());

// Any content kind.
ValidationRule IsTargetingCovid19();

// Vaccination only; false for other content.
ValidationRule IsFullyImmunized();
ValidationRule IsWellKnownVaccineMedicinalProduct();
ValidationRule IsVaccinationInEffect(std::chrono::days waiting_period = std::chrono::days{15},
                                     Clock clock = SystemClock());

// Test only; false for other content. Unknown test types are never valid.
ValidationRule IsTestedNegative();
ValidationRule IsTestValid(Clock clock = SystemClock());

// Recovery only; false for other content.
ValidationRule IsRecoveryValid(Clock clock = SystemClock());

/**
 * @brief The rule applied when no other rule is given.
 *
 * IsIssuedInPast && IsNotExpired
 *   && (!IsVaccination || (IsFullyImmunized && IsWellKnownVaccineMedicinalProduct))
 *   && (!IsTest || (IsTestedNegative && IsTestValid))
 *   && (!IsRecovery || IsRecoveryValid)
 */
ValidationRule Default(Clock clock = SystemClock());

} // namespace hcert::validation::rules
