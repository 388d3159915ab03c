// Copyright (c) 2025 <Your Name>
/**
 * @file state_machine.cc
 * @brief Transition rules. Each function edits a copy and commits it only
 * after every check passed.
 */
#include "wtcore/state_machine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "wtcore/duration_text.hpp"
#include "wtcore/projection.hpp"

namespace wtcore {

namespace {

// Folds the open cycle into the timeline. Caller checked IsOpen().
void CloseOpenCycle(Timer* t, const Timestamp& now) {
  const int paused_total = LivePausedMinutes(*t, now);
  const int64_t cycle_total = MinutesBetween(CycleStart(*t), now);
  const int work =
      static_cast<int>(std::max<int64_t>(0, cycle_total - paused_total));

  // A drop-merge can leave the timeline ending in Work: extend it.
  Work* last = t->timeline.empty() ? nullptr
                                    : std::get_if<Work>(&t->timeline.back());
  if (last != nullptr) {
    last->minutes += work;
    last->paused_minutes += paused_total;
  } else {
    t->timeline.push_back(Work{work, paused_total});
  }

  t->last_stop_time = now;
  t->pause_start_time.reset();
  t->live_paused_minutes = 0;
  t->status = TimerStatus::kStopped;
}

Outcome Resume(Timer* timer, const Timestamp& now,
               const std::optional<int>& backdate_minutes) {
  if (backdate_minutes) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Cannot backdate start time while paused.");
  }
  Timer next = *timer;
  next.live_paused_minutes = LivePausedMinutes(next, now);
  next.pause_start_time.reset();
  next.status = TimerStatus::kRunning;
  *timer = std::move(next);
  return Outcome::Applied("Resuming timer.");
}

}  // namespace

Outcome Start(Timer* timer, const Timestamp& now,
              const std::optional<int>& backdate_minutes) {
  switch (timer->status) {
    case TimerStatus::kRunning:
      return Outcome::Fail(ErrorCode::kState, "Already running.");
    case TimerStatus::kPaused:
      return Resume(timer, now, backdate_minutes);
    case TimerStatus::kStopped:
      break;
  }

  Timer next = *timer;
  const bool first_cycle = !next.anchor_time.has_value();
  const int backdate = backdate_minutes.value_or(0);

  int break_minutes = 0;
  if (next.last_stop_time) {
    break_minutes = static_cast<int>(
        std::max<int64_t>(0, MinutesBetween(*next.last_stop_time, now)));
  }

  if (backdate_minutes && !first_cycle) {
    if (!next.last_stop_time) {
      return Outcome::Fail(ErrorCode::kValidation,
                           "Cannot backdate start time - no break to reduce.");
    }
    if (break_minutes < backdate) {
      return Outcome::Fail(ErrorCode::kValidation,
                           "Cannot reduce break below 0. Break was " +
                               FormatHourMinute(break_minutes) +
                               ", tried to subtract " +
                               FormatHourMinute(backdate) + ".");
    }
  }

  if (next.last_stop_time) {
    const int reduction = first_cycle ? 0 : backdate;
    next.timeline.push_back(Break{break_minutes - reduction});
  }
  if (first_cycle) {
    next.anchor_time = now - backdate;
  }
  next.last_stop_time.reset();
  next.pause_start_time.reset();
  next.live_paused_minutes = 0;
  next.status = TimerStatus::kRunning;

  *timer = std::move(next);
  return Outcome::Applied("Starting timer.");
}

Outcome Pause(Timer* timer, const Timestamp& now,
              const std::optional<int>& add_minutes) {
  switch (timer->status) {
    case TimerStatus::kPaused:
      return Outcome::Fail(ErrorCode::kState, "Timer already paused.");
    case TimerStatus::kStopped:
      return Outcome::Fail(ErrorCode::kState, "Cannot pause stopped timer.");
    case TimerStatus::kRunning:
      break;
  }

  const int add = add_minutes.value_or(0);
  if (add_minutes) {
    const int64_t elapsed = MinutesBetween(CycleStart(*timer), now);
    if (timer->live_paused_minutes + add > elapsed) {
      return Outcome::Fail(ErrorCode::kValidation,
                           "Cannot pause longer than currently elapsed time.");
    }
  }

  timer->pause_start_time = now - add;
  timer->status = TimerStatus::kPaused;
  if (add > 0) {
    return Outcome::Applied("Paused timer (added " + std::to_string(add) +
                            "m pause time)");
  }
  return Outcome::Applied("Paused timer");
}

Outcome Stop(Timer* timer, const Timestamp& now) {
  if (!timer->IsOpen()) {
    return Outcome::Fail(ErrorCode::kState, "Timer already stopped.");
  }
  CloseOpenCycle(timer, now);
  return Outcome::Applied("Timer stopped.");
}

Outcome Next(Timer* timer, const Timestamp& now) {
  if (!timer->IsOpen()) {
    return Outcome::Fail(ErrorCode::kState, "Timer already stopped.");
  }

  Timer next = *timer;
  CloseOpenCycle(&next, now);
  next.timeline.push_back(Break{0});
  // The zero break already covers the gap: no break derived from stop time.
  next.last_stop_time.reset();
  next.status = TimerStatus::kRunning;

  *timer = std::move(next);
  return Outcome::Applied("Next cycle started.");
}

}  // namespace wtcore
