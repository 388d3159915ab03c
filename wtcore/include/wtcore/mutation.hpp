// Copyright (c) 2025 <Your Name>
/**
 * @file mutation.hpp
 * @brief Historical edits of a Timer.
 *
 * Cycle indices are 1-based over the completed timeline plus, while a cycle
 * is open, one trailing slot (timeline.size() + 1) for the open cycle.
 * Because timestamps are projected, an edit to one entry relocates every
 * later boundary on the next read without further bookkeeping.
 *
 * All functions leave the aggregate untouched unless the Outcome is ok.
 */
#pragma once

#include <cstddef>
#include <string>

#include "wtcore/error.hpp"
#include "wtcore/timer.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {

enum class Direction { kAdd, kSub };

/** Parses `add|sub`; out untouched on failure. */
bool ParseDirection(const std::string& text, Direction* out);

/**
 * @brief Shift the anchor (day start).
 *
 * While the first cycle is still open and paused, the pause start moves by
 * the same amount so the open cycle's work minutes stay unchanged.
 */
Outcome ModStart(Timer* timer, Direction dir, int minutes);

/**
 * @brief Edit the minutes of a completed entry.
 *
 * The open slot has no stored duration and is rejected.
 */
Outcome ModDuration(Timer* timer, size_t index, Direction dir, int minutes);

/**
 * @brief Edit paused minutes of a completed Work entry or the open cycle.
 *
 * The open slot is editable only while Running. Breaks have no pause time.
 */
Outcome ModPause(Timer* timer, size_t index, Direction dir, int minutes);

/**
 * @brief Remove a completed entry and re-join its neighbours.
 *
 * See internal/drop_merge.hpp for the merge rules.
 * @param now Used only to report the merged open cycle's work time.
 */
Outcome DropEntry(Timer* timer, size_t index, const Timestamp& now);

}  // namespace wtcore
