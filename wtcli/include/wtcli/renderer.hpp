// Copyright (c) 2025 <Your Name>
/**
 * @file renderer.hpp
 * @brief Human-readable views of a Timer.
 *
 * All functions are pure: they read the projection of the timer at `now`
 * and never modify it.
 */
#pragma once

#include <string>
#include <vector>

#include "wtcore/timer.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcli {

/**
 * @brief Numbered timeline lines, one per cycle plus the open cycle.
 *
 * Returns {"No work cycles recorded."} for an empty stopped timer.
 */
std::vector<std::string> RenderLog(const wtcore::Timer& t,
                                   const wtcore::Timestamp& now);

/** `<current> <STATUS>[ |PPm|] (<total>)` */
std::string RenderCheck(const wtcore::Timer& t, const wtcore::Timestamp& now);

/**
 * @brief One-line day summary used by `report` and the daily report file.
 *
 * Returns "No work recorded today." before the first start.
 */
std::string RenderReport(const wtcore::Timer& t, const wtcore::Timestamp& now);

/** Usage text for the `mod` command family. */
std::string RenderModUsage();

}  // namespace wtcli
