// Copyright (c) 2025 <Your Name>
/**
 * @file default_time_source.hpp
 * @brief Platform-specific default TimeSource factory.
 */
#pragma once

#include <memory>
#include <optional>

#include "wtcore/time_source.hpp"

namespace wtcore {
namespace platform {

/**
 * @brief Creates the TimeSource for one invocation.
 * @param fixed_now Injected time; when set a FixedTimeSource is returned.
 * @return Unique pointer to FixedTimeSource or LocalClock.
 */
std::unique_ptr<TimeSource> CreateDefaultTimeSource(
    const std::optional<Timestamp>& fixed_now);

}  // namespace platform
}  // namespace wtcore
