// Copyright (c) 2025 <Your Name>
#include "wtcore/projection.hpp"

#include <algorithm>

namespace wtcore {

Timestamp CycleStart(const Timer& timer) {
  Timestamp start = timer.anchor_time.value_or(Timestamp());
  for (const Cycle& c : timer.timeline) {
    start = start + Duration(c);
  }
  return start;
}

std::vector<EntryBoundary> EntryBoundaries(const Timer& timer) {
  std::vector<EntryBoundary> out;
  out.reserve(timer.timeline.size());

  Timestamp cursor = timer.anchor_time.value_or(Timestamp());
  int cumulative = 0;
  for (size_t i = 0; i < timer.timeline.size(); ++i) {
    const Cycle& c = timer.timeline[i];
    if (const Work* w = std::get_if<Work>(&c)) cumulative += w->minutes;

    EntryBoundary b;
    b.index = i + 1;
    b.start = cursor;
    b.end = cursor + Duration(c);
    b.cycle = c;
    b.cumulative_work_minutes = cumulative;
    out.push_back(b);

    cursor = b.end;
  }
  return out;
}

int LivePausedMinutes(const Timer& timer, const Timestamp& now) {
  if (!timer.IsOpen()) return 0;
  int paused = timer.live_paused_minutes;
  if (timer.status == TimerStatus::kPaused && timer.pause_start_time) {
    // A pause reference later than now (clock moved back) counts as 0.
    paused += static_cast<int>(std::max<int64_t>(
        0, MinutesBetween(*timer.pause_start_time, now)));
  }
  return paused;
}

int LiveElapsedWorkMinutes(const Timer& timer, const Timestamp& now) {
  if (!timer.IsOpen()) return 0;
  const int64_t since_open = MinutesBetween(CycleStart(timer), now);
  const int64_t work = since_open - LivePausedMinutes(timer, now);
  return static_cast<int>(std::max<int64_t>(0, work));
}

std::optional<OpenCycleView> OpenCycle(const Timer& timer,
                                       const Timestamp& now) {
  if (!timer.IsOpen()) return std::nullopt;

  int completed_work = 0;
  for (const Cycle& c : timer.timeline) {
    if (const Work* w = std::get_if<Work>(&c)) completed_work += w->minutes;
  }

  OpenCycleView v;
  v.index = timer.timeline.size() + 1;
  v.start = CycleStart(timer);
  v.work_minutes = LiveElapsedWorkMinutes(timer, now);
  v.paused_minutes = LivePausedMinutes(timer, now);
  v.cumulative_work_minutes = completed_work + v.work_minutes;
  v.paused = timer.status == TimerStatus::kPaused;
  return v;
}

Totals ComputeTotals(const Timer& timer, const Timestamp& now) {
  Totals t;
  for (const Cycle& c : timer.timeline) {
    if (const Work* w = std::get_if<Work>(&c)) {
      t.work_minutes += w->minutes;
      t.paused_minutes += w->paused_minutes;
    } else {
      t.break_minutes += std::get<Break>(c).minutes;
    }
  }

  t.start = timer.anchor_time.value_or(Timestamp());
  t.end = CycleStart(timer);
  if (timer.IsOpen()) {
    const int live_work = LiveElapsedWorkMinutes(timer, now);
    t.work_minutes += live_work;
    t.paused_minutes += LivePausedMinutes(timer, now);
    t.end = t.end + live_work;
  }
  t.elapsed_minutes = t.work_minutes + t.break_minutes + t.paused_minutes;
  t.day_offset = static_cast<int>(t.end.Day() - t.start.Day());
  return t;
}

}  // namespace wtcore
