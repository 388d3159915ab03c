// Copyright (c) 2025 <Your Name>
/**
 * @file local_clock.cc (POSIX)
 * @brief POSIX-specific implementation using localtime_r().
 */
#include "wtcore/local_clock.hpp"

#include <time.h>

#include <chrono>
#include <ctime>

namespace wtcore {

Timestamp LocalClock::Now() {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  // Seconds are dropped: all durations are whole wall-clock minutes.
  return Timestamp::FromCivil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                              tm.tm_hour, tm.tm_min);
}

}  // namespace wtcore
