// Copyright (c) 2025 <Your Name>
/**
 * @file timestamp.hpp
 * @brief Local wall-clock time with minute resolution.
 *
 * Provides a Timestamp structure (minutes on the local civil calendar) and
 * utility functions for minute arithmetic and conversion to/from the
 * `YYYY-MM-DD HH:MM` text form used by storage and configuration.
 */
#pragma once

#include <cstdint>
#include <string>

#include "wtcore/export.hpp"

namespace wtcore {

/**
 * @brief Local civil time at minute resolution.
 *
 * Represents a wall-clock instant as whole minutes since 1970-01-01 00:00 on
 * the local calendar. No time zone or DST information is carried: two
 * Timestamps differ by exactly the number of wall-clock minutes between them.
 */
struct WTCORE_API Timestamp {
  int64_t minutes;  ///< Minutes since 1970-01-01 00:00 (local calendar)

  /** Default constructor: the epoch (1970-01-01 00:00) */
  Timestamp() : minutes(0) {}

  /** Constructor from minutes since the epoch */
  explicit Timestamp(int64_t m) : minutes(m) {}

  /**
   * @brief Build a Timestamp from calendar fields.
   *
   * Fields are not range-checked; use Parse() for untrusted input.
   */
  static Timestamp FromCivil(int year, int month, int day, int hour,
                             int minute);

  /**
   * @brief Parse `YYYY-MM-DD HH:MM`.
   *
   * @param text Input text (exactly 16 characters).
   * @param out Parsed value on success; untouched on failure.
   * @return true on success, false on malformed or out-of-range fields.
   */
  static bool Parse(const std::string& text, Timestamp* out);

  /** Format as `YYYY-MM-DD HH:MM`. */
  std::string ToString() const;

  /** Format the time of day as `HH:MM`. */
  std::string ToTimeOfDay() const;

  /** Format the date as `YYYY-MM-DD`. */
  std::string ToDate() const;

  /** Day index since the epoch (floor division, also for negative times). */
  int64_t Day() const;
};

// Comparison operators
inline bool operator==(const Timestamp& a, const Timestamp& b) {
  return a.minutes == b.minutes;
}

inline bool operator!=(const Timestamp& a, const Timestamp& b) {
  return !(a == b);
}

inline bool operator<(const Timestamp& a, const Timestamp& b) {
  return a.minutes < b.minutes;
}

inline bool operator<=(const Timestamp& a, const Timestamp& b) {
  return !(b < a);
}

inline bool operator>(const Timestamp& a, const Timestamp& b) { return b < a; }

inline bool operator>=(const Timestamp& a, const Timestamp& b) {
  return !(a < b);
}

// Arithmetic operators

/** Shift a Timestamp later by a number of minutes (may be negative). */
inline Timestamp operator+(const Timestamp& t, int64_t minutes) {
  return Timestamp(t.minutes + minutes);
}

/** Shift a Timestamp earlier by a number of minutes (may be negative). */
inline Timestamp operator-(const Timestamp& t, int64_t minutes) {
  return Timestamp(t.minutes - minutes);
}

/**
 * @brief Signed number of minutes from start to end.
 *
 * @param start Earlier instant.
 * @param end Later instant.
 * @return end - start in minutes (negative when end precedes start).
 */
inline int64_t MinutesBetween(const Timestamp& start, const Timestamp& end) {
  return end.minutes - start.minutes;
}

}  // namespace wtcore
