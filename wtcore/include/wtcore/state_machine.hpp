// Copyright (c) 2025 <Your Name>
/**
 * @file state_machine.hpp
 * @brief Stopped/Running/Paused transitions of a Timer.
 *
 * Every transition takes the aggregate explicitly and the single "now"
 * sampled for the invocation. The aggregate is modified only when the
 * returned Outcome is ok; invalid transitions report ErrorCode::kState and
 * leave it untouched.
 */
#pragma once

#include <optional>

#include "wtcore/error.hpp"
#include "wtcore/timer.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {

/**
 * @brief Start a new cycle (from Stopped) or resume (from Paused).
 *
 * From Stopped, the time since the last stop is recorded as a Break and the
 * anchor is set on the very first cycle. A backdate moves the anchor earlier
 * on the first cycle, or shortens the just-recorded Break on later cycles.
 *
 * @param timer Aggregate to update.
 * @param now Current time.
 * @param backdate_minutes Optional minutes to start earlier than now.
 */
Outcome Start(Timer* timer, const Timestamp& now,
              const std::optional<int>& backdate_minutes = std::nullopt);

/**
 * @brief Pause the running cycle.
 * @param add_minutes Optional pause time that already elapsed before now.
 */
Outcome Pause(Timer* timer, const Timestamp& now,
              const std::optional<int>& add_minutes = std::nullopt);

/** Close the open cycle into the timeline. */
Outcome Stop(Timer* timer, const Timestamp& now);

/** Stop, record a zero-length Break, and open the next cycle at once. */
Outcome Next(Timer* timer, const Timestamp& now);

}  // namespace wtcore
