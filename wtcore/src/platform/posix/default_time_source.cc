// Copyright (c) 2025 <Your Name>
/**
 * @file default_time_source.cc (POSIX)
 * @brief POSIX implementation - creates LocalClock or FixedTimeSource.
 */
#include "wtcore/platform/default_time_source.hpp"

#include <memory>

#include "wtcore/local_clock.hpp"

namespace wtcore {
namespace platform {

std::unique_ptr<TimeSource> CreateDefaultTimeSource(
    const std::optional<Timestamp>& fixed_now) {
  if (fixed_now) {
    return std::make_unique<FixedTimeSource>(*fixed_now);
  }
  return std::make_unique<LocalClock>();
}

}  // namespace platform
}  // namespace wtcore
