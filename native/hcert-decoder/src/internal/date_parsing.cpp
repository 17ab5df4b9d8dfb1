// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "date_parsing.h"

#include <chrono>
#include <cstddef>

namespace hcert::decoder::internal {

namespace {

bool ReadDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }

  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool ReadCalendarDate(std::string_view text, Date& out) {
  int y = 0;
  int m = 0;
  int d = 0;
  if (!ReadDigits(text, 0, 4, y) || text[4] != '-' || !ReadDigits(text, 5, 2, m) || text[7] != '-' ||
      !ReadDigits(text, 8, 2, d)) {
    return false;
  }

  const Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return false;
  }
  out = date;
  return true;
}

} // namespace

bool ParseDate(std::string_view text, Date& out) {
  return text.size() == 10 && ReadCalendarDate(text, out);
}

bool IsValidDateOfBirth(std::string_view text) {
  int y = 0;
  int m = 0;
  switch (text.size()) {
    case 0:
      return true;
    case 4:
      return ReadDigits(text, 0, 4, y);
    case 7:
      return ReadDigits(text, 0, 4, y) && text[4] == '-' && ReadDigits(text, 5, 2, m) && m >= 1 && m <= 12;
    case 10: {
      Date date;
      return ReadCalendarDate(text, date);
    }
    default:
      return false;
  }
}

bool ParseDateTime(std::string_view text, Timestamp& out) {
  // YYYY-MM-DDTHH:MM:SS is the shortest accepted prefix, followed by at least a 'Z'.
  if (text.size() < 20) {
    return false;
  }

  Date date;
  if (!ReadCalendarDate(text.substr(0, 10), date)) {
    return false;
  }
  if (text[10] != 'T' && text[10] != 't') {
    return false;
  }

  int hh = 0;
  int mm = 0;
  int ss = 0;
  if (!ReadDigits(text, 11, 2, hh) || text[13] != ':' || !ReadDigits(text, 14, 2, mm) || text[16] != ':' ||
      !ReadDigits(text, 17, 2, ss)) {
    return false;
  }
  // Leap seconds are folded into the following minute by sys_seconds arithmetic.
  if (hh > 23 || mm > 59 || ss > 60) {
    return false;
  }

  std::size_t pos = 19;
  if (text[pos] == '.') {
    ++pos;
    const std::size_t digits_start = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
    if (pos == digits_start) {
      return false;
    }
  }

  if (pos >= text.size()) {
    return false;
  }

  std::chrono::minutes offset{0};
  const char zone = text[pos];
  if (zone == 'Z' || zone == 'z') {
    ++pos;
  } else if (zone == '+' || zone == '-') {
    int oh = 0;
    int om = 0;
    if (!ReadDigits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
        !ReadDigits(text, pos + 4, 2, om) || oh > 23 || om > 59) {
      return false;
    }
    offset = std::chrono::hours{oh} + std::chrono::minutes{om};
    if (zone == '-') {
      offset = -offset;
    }
    pos += 6;
  } else {
    return false;
  }

  if (pos != text.size()) {
    return false;
  }

  const auto local = std::chrono::sys_days{date} + std::chrono::hours{hh} + std::chrono::minutes{mm} + std::chrono::seconds{ss};
  out = std::chrono::time_point_cast<std::chrono::seconds>(local - offset);
  return true;
}

} // namespace hcert::decoder::internal
