// Copyright (c) 2025 <Your Name>
#include "internal/drop_merge.hpp"

#include <iterator>

#include "wtcore/duration_text.hpp"
#include "wtcore/projection.hpp"

namespace wtcore {
namespace internal {

namespace {

using Merge = DropResult::Merge;

DropResult DropBreak(Timer* t, size_t pos, const Timestamp& now) {
  auto& tl = t->timeline;
  const bool has_prev_work = pos > 0 && IsWork(tl[pos - 1]);
  const bool has_next_work = pos + 1 < tl.size() && IsWork(tl[pos + 1]);
  const bool is_last = pos + 1 == tl.size();

  DropResult r;
  if (has_prev_work && is_last && t->IsOpen()) {
    // The open cycle now starts where the previous Work started.
    t->live_paused_minutes += std::get<Work>(tl[pos - 1]).paused_minutes;
    tl.erase(std::next(tl.begin(), pos - 1), std::next(tl.begin(), pos + 1));
    r.merge = Merge::kRunningCycle;
    r.merged_minutes = LiveElapsedWorkMinutes(*t, now);
  } else if (has_prev_work && has_next_work) {
    Work& prev = std::get<Work>(tl[pos - 1]);
    const Work& next = std::get<Work>(tl[pos + 1]);
    prev.minutes += std::get<Break>(tl[pos]).minutes + next.minutes;
    prev.paused_minutes += next.paused_minutes;
    r.merge = Merge::kWorkCycles;
    r.merged_minutes = prev.minutes;
    tl.erase(std::next(tl.begin(), pos), std::next(tl.begin(), pos + 2));
  } else {
    tl.erase(std::next(tl.begin(), pos));
  }
  return r;
}

DropResult DropWork(Timer* t, size_t pos) {
  auto& tl = t->timeline;
  const bool has_prev_break = pos > 0 && IsBreak(tl[pos - 1]);
  const bool has_next_break = pos + 1 < tl.size() && IsBreak(tl[pos + 1]);
  // The work interval is reinterpreted as break time.
  const int elapsed = Elapsed(tl[pos]);

  DropResult r;
  if (has_prev_break && has_next_break) {
    Break& prev = std::get<Break>(tl[pos - 1]);
    prev.minutes += elapsed + std::get<Break>(tl[pos + 1]).minutes;
    r.merge = Merge::kBreaks;
    r.merged_minutes = prev.minutes;
    tl.erase(std::next(tl.begin(), pos), std::next(tl.begin(), pos + 2));
  } else if (has_prev_break) {
    Break& prev = std::get<Break>(tl[pos - 1]);
    prev.minutes += elapsed;
    r.merge = Merge::kPreviousBreak;
    r.merged_minutes = prev.minutes;
    tl.erase(std::next(tl.begin(), pos));
  } else if (has_next_break) {
    Break& next = std::get<Break>(tl[pos + 1]);
    next.minutes += elapsed;
    r.merge = Merge::kNextBreak;
    r.merged_minutes = next.minutes;
    tl.erase(std::next(tl.begin(), pos));
  } else {
    tl[pos] = Break{elapsed};
    r.merge = Merge::kConvertedBreak;
    r.merged_minutes = elapsed;
  }
  return r;
}

}  // namespace

DropResult DropAndMerge(Timer* timer, size_t pos, const Timestamp& now) {
  if (IsBreak(timer->timeline[pos])) return DropBreak(timer, pos, now);
  return DropWork(timer, pos);
}

std::string DescribeMerge(const DropResult& result) {
  const std::string amount = FormatHourMinute(result.merged_minutes);
  switch (result.merge) {
    case Merge::kNone:
      return "";
    case Merge::kWorkCycles:
      return " (merged adjacent work cycles: " + amount + ")";
    case Merge::kRunningCycle:
      return " (merged with running cycle: " + amount + ")";
    case Merge::kBreaks:
      return " (merged adjacent breaks: " + amount + ")";
    case Merge::kPreviousBreak:
      return " (merged into previous break: " + amount + ")";
    case Merge::kNextBreak:
      return " (merged into next break: " + amount + ")";
    case Merge::kConvertedBreak:
      return " (converted to break: " + amount + ")";
  }
  return "";
}

}  // namespace internal
}  // namespace wtcore
