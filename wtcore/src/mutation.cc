// Copyright (c) 2025 <Your Name>
#include "wtcore/mutation.hpp"

#include <string>
#include <utility>

#include "internal/drop_merge.hpp"
#include "wtcore/duration_text.hpp"

namespace wtcore {

namespace {

std::string Signed(Direction dir, int minutes) {
  return (dir == Direction::kSub ? "-" : "+") + FormatHourMinute(minutes);
}

Outcome OutOfRange(size_t index, size_t max_index) {
  if (max_index == 0) {
    return Outcome::Fail(ErrorCode::kRange, "No cycles to modify.");
  }
  return Outcome::Fail(ErrorCode::kRange,
                       "Cycle " + std::to_string(index) +
                           " does not exist. Valid range: 1-" +
                           std::to_string(max_index));
}

// Applies add/sub to a non-negative minute field.
bool Adjust(int* field, Direction dir, int minutes) {
  if (dir == Direction::kAdd) {
    *field += minutes;
    return true;
  }
  if (*field - minutes < 0) return false;
  *field -= minutes;
  return true;
}

bool IsOpenSlot(const Timer& t, size_t index) {
  return t.IsOpen() && index == t.timeline.size() + 1;
}

}  // namespace

bool ParseDirection(const std::string& text, Direction* out) {
  if (out == nullptr) return false;
  if (text == "add") {
    *out = Direction::kAdd;
  } else if (text == "sub") {
    *out = Direction::kSub;
  } else {
    return false;
  }
  return true;
}

Outcome ModStart(Timer* timer, Direction dir, int minutes) {
  if (!timer->anchor_time) {
    return Outcome::Fail(ErrorCode::kState, "No day start to modify.");
  }

  const int64_t delta = dir == Direction::kAdd ? minutes : -minutes;
  timer->anchor_time = *timer->anchor_time + delta;
  // First cycle still open: keep the pause reference aligned with it.
  if (timer->timeline.empty() && timer->pause_start_time) {
    timer->pause_start_time = *timer->pause_start_time + delta;
  }
  return Outcome::Applied("Day start adjusted by " + Signed(dir, minutes));
}

Outcome ModDuration(Timer* timer, size_t index, Direction dir, int minutes) {
  if (IsOpenSlot(*timer, index)) {
    const std::string n = std::to_string(index);
    return Outcome::Fail(
        ErrorCode::kValidation,
        "Cannot modify duration of current running cycle.\n"
        "To adjust when this cycle started, modify the previous cycle or "
        "break duration.\n"
        "To adjust paused time: wt mod " +
            n + " pause <add|sub> <time>");
  }
  if (index < 1 || index > timer->timeline.size()) {
    return OutOfRange(index, timer->timeline.size());
  }

  Cycle& entry = timer->timeline[index - 1];
  int* field = nullptr;
  if (Work* w = std::get_if<Work>(&entry)) {
    field = &w->minutes;
  } else {
    field = &std::get<Break>(entry).minutes;
  }

  const int current = *field;
  if (!Adjust(field, dir, minutes)) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Error: Duration would be negative. Current: " +
                             FormatHourMinute(current));
  }
  return Outcome::Applied("Modified cycle " + std::to_string(index) +
                          " duration by " + Signed(dir, minutes));
}

Outcome ModPause(Timer* timer, size_t index, Direction dir, int minutes) {
  if (IsOpenSlot(*timer, index)) {
    if (timer->status == TimerStatus::kPaused) {
      return Outcome::Fail(ErrorCode::kState,
                           "Cannot modify pause time while paused.\n"
                           "Resume first with 'wt start', then modify pause "
                           "time.");
    }
    const int current = timer->live_paused_minutes;
    if (!Adjust(&timer->live_paused_minutes, dir, minutes)) {
      return Outcome::Fail(ErrorCode::kValidation,
                           "Error: Paused time would be negative. Current: " +
                               FormatHourMinute(current));
    }
    return Outcome::Applied("Modified current cycle paused time by " +
                            Signed(dir, minutes));
  }

  if (index < 1 || index > timer->timeline.size()) {
    return OutOfRange(index, timer->MaxIndex());
  }

  Work* work = std::get_if<Work>(&timer->timeline[index - 1]);
  if (work == nullptr) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Cycle " + std::to_string(index) +
                             " is a break. Paused time can only be modified "
                             "for work cycles.");
  }
  const int current = work->paused_minutes;
  if (!Adjust(&work->paused_minutes, dir, minutes)) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Error: Paused time would be negative. Current: " +
                             FormatHourMinute(current));
  }
  return Outcome::Applied("Modified cycle " + std::to_string(index) +
                          " paused time by " + Signed(dir, minutes));
}

Outcome DropEntry(Timer* timer, size_t index, const Timestamp& now) {
  if (index < 1 || index > timer->timeline.size()) {
    return OutOfRange(index, timer->timeline.size());
  }
  internal::DropResult r = internal::DropAndMerge(timer, index - 1, now);
  return Outcome::Applied("Removed cycle " + std::to_string(index) +
                          internal::DescribeMerge(r));
}

}  // namespace wtcore
