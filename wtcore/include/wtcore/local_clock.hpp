// Copyright (c) 2025 <Your Name>
/**
 * @file local_clock.hpp
 * @brief TimeSource backed by the operating system's local wall clock.
 */
#pragma once

#include "wtcore/export.hpp"
#include "wtcore/time_source.hpp"

namespace wtcore {

/**
 * @brief Real local clock truncated to whole minutes.
 *
 * Converts the system clock through the local time zone rules, so the
 * returned Timestamp matches what a wall clock in the user's zone shows.
 */
class WTCORE_API LocalClock : public TimeSource {
 public:
  LocalClock() = default;
  ~LocalClock() override = default;

  Timestamp Now() override;
};

}  // namespace wtcore
