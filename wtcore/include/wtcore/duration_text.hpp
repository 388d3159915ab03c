// Copyright (c) 2025 <Your Name>
/**
 * @file duration_text.hpp
 * @brief Minute quantities as typed by the user and as displayed.
 */
#pragma once

#include <string>

namespace wtcore {

/**
 * @brief Parse a 1-4 digit `HHMM` quantity into minutes.
 *
 * Lengths 1-2 are plain minutes; lengths 3-4 read the rightmost two digits
 * as minutes and the rest as hours. With two or more digits the minute part
 * must not exceed 59.
 *
 * @param text User input.
 * @param out Minutes on success; untouched on failure.
 * @param err User-facing reason on failure.
 * @return true on success.
 */
bool ParseMinutes(const std::string& text, int* out, std::string* err);

/** Formats minutes as `Hh:MMm` (log and report style). */
std::string FormatHourMinute(int minutes);

/** Formats minutes as `Hh MMm` (check style). */
std::string FormatHourMinuteSpaced(int minutes);

}  // namespace wtcore
