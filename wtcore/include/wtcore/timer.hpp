// Copyright (c) 2025 <Your Name>
/**
 * @file timer.hpp
 * @brief The persisted timer aggregate.
 *
 * A Timer stores one anchor timestamp and the ordered list of completed
 * cycles. Every other instant (cycle starts/ends, the open cycle's start) is
 * projected from those two, see projection.hpp.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "wtcore/cycle.hpp"
#include "wtcore/export.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {

enum class TimerStatus { kStopped, kRunning, kPaused };

/** Output verbosity of the command line. */
enum class Mode { kSilent, kNormal, kVerbose };

const char* ToString(TimerStatus s);
const char* ToString(Mode m);

/** Parses `stopped|running|paused`; out untouched on failure. */
bool ParseStatus(const std::string& text, TimerStatus* out);

/** Parses `silent|normal|verbose`; out untouched on failure. */
bool ParseMode(const std::string& text, Mode* out);

/**
 * @brief Timer aggregate.
 *
 * Invariants:
 * - anchor_time + sum of Duration() over any timeline prefix is the start of
 *   the next cycle.
 * - pause_start_time is present iff status == kPaused.
 * - last_stop_time is present only while status == kStopped.
 * - anchor_time is present whenever the timeline is non-empty or a cycle is
 *   open.
 */
struct WTCORE_API Timer {
  TimerStatus status = TimerStatus::kStopped;
  std::optional<Timestamp> anchor_time;
  std::vector<Cycle> timeline;
  int live_paused_minutes = 0;
  std::optional<Timestamp> pause_start_time;
  std::optional<Timestamp> last_stop_time;
  Mode mode = Mode::kSilent;

  /** True while a cycle is open (Running or Paused). */
  bool IsOpen() const {
    return status == TimerStatus::kRunning || status == TimerStatus::kPaused;
  }

  /** Highest addressable 1-based cycle index (N, or N+1 while open). */
  size_t MaxIndex() const { return timeline.size() + (IsOpen() ? 1 : 0); }

  /** Stream formatter for the debug command. */
  friend std::ostream& operator<<(std::ostream& os, const Timer& t);
};

/** Creates the empty aggregate used by reset/new/restart. */
Timer MakeEmptyTimer(Mode mode);

/**
 * @brief Verify the structural invariants listed on Timer.
 * @param timer Aggregate to check.
 * @param err Description of the first violation found.
 * @return true when every invariant holds.
 */
bool CheckInvariants(const Timer& timer, std::string* err);

}  // namespace wtcore
