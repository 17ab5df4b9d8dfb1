// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

#include <string_view>

#include "hcert/decoder/certificate.h"

namespace hcert::decoder::internal {

// Full date "YYYY-MM-DD".
bool ParseDate(std::string_view text, Date& out);

// Date of birth: "", "YYYY", "YYYY-MM" or "YYYY-MM-DD".
bool IsValidDateOfBirth(std::string_view text);

// RFC 3339 date-time: "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".
// Fractional seconds are truncated.
bool ParseDateTime(std::string_view text, Timestamp& out);

} // namespace hcert::decoder::internal
