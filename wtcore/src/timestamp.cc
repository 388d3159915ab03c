// Copyright (c) 2025 <Your Name>
/**
 * @file timestamp.cc
 * @brief Implementation of Timestamp calendar conversion and formatting.
 */
#include "wtcore/timestamp.hpp"

#include <cstdio>

namespace wtcore {

namespace {

constexpr int64_t kMinutesPerDay = 24 * 60;

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int64_t y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;                                // [0, 399]
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;  // [0, 365]
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;        // [0, 146096]
  return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t z, int* year, int* month, int* day) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  *year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
  *month = m;
  *day = d;
}

int64_t FloorDiv(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

bool IsLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int DaysInMonth(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30,
                                31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeap(y)) return 29;
  return kDays[m - 1];
}

bool ReadDigits(const std::string& s, size_t at, size_t n, int* out) {
  int v = 0;
  for (size_t i = at; i < at + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

}  // namespace

Timestamp Timestamp::FromCivil(int year, int month, int day, int hour,
                               int minute) {
  int64_t days = DaysFromCivil(year, month, day);
  return Timestamp(days * kMinutesPerDay + hour * 60 + minute);
}

bool Timestamp::Parse(const std::string& text, Timestamp* out) {
  // YYYY-MM-DD HH:MM
  if (out == nullptr || text.size() != 16) return false;
  if (text[4] != '-' || text[7] != '-' || text[10] != ' ' || text[13] != ':') {
    return false;
  }
  int y = 0, mo = 0, d = 0, h = 0, mi = 0;
  if (!ReadDigits(text, 0, 4, &y) || !ReadDigits(text, 5, 2, &mo) ||
      !ReadDigits(text, 8, 2, &d) || !ReadDigits(text, 11, 2, &h) ||
      !ReadDigits(text, 14, 2, &mi)) {
    return false;
  }
  if (mo < 1 || mo > 12 || d < 1 || d > DaysInMonth(y, mo) || h > 23 ||
      mi > 59) {
    return false;
  }
  *out = FromCivil(y, mo, d, h, mi);
  return true;
}

int64_t Timestamp::Day() const { return FloorDiv(minutes, kMinutesPerDay); }

std::string Timestamp::ToString() const {
  return ToDate() + " " + ToTimeOfDay();
}

std::string Timestamp::ToTimeOfDay() const {
  const int64_t in_day = minutes - Day() * kMinutesPerDay;
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", static_cast<int>(in_day / 60),
                static_cast<int>(in_day % 60));
  return buf;
}

std::string Timestamp::ToDate() const {
  int y = 0, m = 0, d = 0;
  CivilFromDays(Day(), &y, &m, &d);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
  return buf;
}

}  // namespace wtcore
