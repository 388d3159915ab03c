// Copyright (c) 2025 <Your Name>
#include "wtcore/duration_text.hpp"

#include <cstdio>

namespace wtcore {

bool ParseMinutes(const std::string& text, int* out, std::string* err) {
  if (out == nullptr) return false;
  if (text.empty() || text.size() > 4) {
    if (err) *err = "Incorrect time format. Should be 1-4 digit HHMM.";
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      if (err) *err = "Incorrect time format. Should be 1-4 digit HHMM.";
      return false;
    }
  }

  const size_t split = text.size() > 2 ? text.size() - 2 : 0;
  const int hours = split > 0 ? std::stoi(text.substr(0, split)) : 0;
  const int minutes = std::stoi(text.substr(split));
  if (text.size() >= 2 && minutes > 59) {
    if (err) *err = "Incorrect time format. Minutes cannot exceed 59.";
    return false;
  }

  *out = hours * 60 + minutes;
  return true;
}

std::string FormatHourMinute(int minutes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%dh:%02dm", minutes / 60, minutes % 60);
  return buf;
}

std::string FormatHourMinuteSpaced(int minutes) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%dh %02dm", minutes / 60, minutes % 60);
  return buf;
}

}  // namespace wtcore
