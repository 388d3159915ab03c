// Copyright (c) 2025 <Your Name>
/**
 * @file projection.hpp
 * @brief Derives concrete timestamps and totals from a Timer.
 *
 * Nothing here is cached: every call folds the timeline from the anchor
 * again, so an edit made by the mutation engine is visible to the next read
 * without any bookkeeping.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "wtcore/cycle.hpp"
#include "wtcore/timer.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {

/** Projected position of one completed cycle. */
struct EntryBoundary {
  size_t index = 0;  ///< 1-based position in the timeline
  Timestamp start;
  Timestamp end;
  Cycle cycle;
  int cumulative_work_minutes = 0;  ///< Work minutes up to and including this
};

/** Projected state of the open cycle. */
struct OpenCycleView {
  size_t index = 0;  ///< timeline.size() + 1
  Timestamp start;
  int work_minutes = 0;
  int paused_minutes = 0;  ///< Folded plus in-progress pause time
  int cumulative_work_minutes = 0;
  bool paused = false;
};

/** Aggregated totals for check/report output. */
struct Totals {
  int work_minutes = 0;
  int break_minutes = 0;
  int paused_minutes = 0;
  int elapsed_minutes = 0;  ///< work + break + paused
  Timestamp start;          ///< Anchor
  Timestamp end;            ///< End of the last cycle (or now-ish while open)
  int day_offset = 0;       ///< Calendar days between start and end
};

/**
 * @brief Start of the next (open or next-to-be-opened) cycle.
 *
 * Anchor plus the Duration() of every completed cycle. Without an anchor the
 * fold starts at the epoch Timestamp.
 */
Timestamp CycleStart(const Timer& timer);

/** One boundary per completed cycle, in timeline order. */
std::vector<EntryBoundary> EntryBoundaries(const Timer& timer);

/** Pause minutes of the open cycle, including a pause in progress. */
int LivePausedMinutes(const Timer& timer, const Timestamp& now);

/**
 * @brief Work minutes of the open cycle.
 * @return max(0, (now - CycleStart) - LivePausedMinutes); 0 while stopped.
 */
int LiveElapsedWorkMinutes(const Timer& timer, const Timestamp& now);

/** View of the open cycle; empty while stopped. */
std::optional<OpenCycleView> OpenCycle(const Timer& timer,
                                       const Timestamp& now);

/** Totals over completed cycles plus the open cycle. */
Totals ComputeTotals(const Timer& timer, const Timestamp& now);

}  // namespace wtcore
