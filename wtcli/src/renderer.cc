// Copyright (c) 2025 <Your Name>
#include "wtcli/renderer.hpp"

#include <cctype>
#include <cstdio>

#include "wtcore/duration_text.hpp"
#include "wtcore/projection.hpp"

namespace wtcli {

using wtcore::FormatHourMinute;
using wtcore::MinutesBetween;

namespace {

// The open cycle counts whole 24h periods, completed cycles calendar days.
constexpr int64_t kMinutesPerDay = 24 * 60;

std::string Index(size_t i) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%02zu", i);
  return buf;
}

std::string PausedMarker(int minutes) {
  if (minutes <= 0) return "";
  char buf[24];
  std::snprintf(buf, sizeof(buf), " |%02dm|", minutes);
  return buf;
}

std::string DayMarker(int64_t days, const char* sep) {
  if (days <= 0) return "";
  return std::string(sep) + "[+" + std::to_string(days) + " day]";
}

}  // namespace

std::vector<std::string> RenderLog(const wtcore::Timer& t,
                                   const wtcore::Timestamp& now) {
  std::vector<std::string> lines;
  if (t.timeline.empty() && !t.IsOpen()) {
    lines.push_back("No work cycles recorded.");
    return lines;
  }

  for (const wtcore::EntryBoundary& b : wtcore::EntryBoundaries(t)) {
    std::string line = Index(b.index) + ". [" + b.start.ToTimeOfDay() +
                       " => " + b.end.ToTimeOfDay() + "] ";
    if (const wtcore::Work* w = std::get_if<wtcore::Work>(&b.cycle)) {
      line += "Work: " + FormatHourMinute(w->minutes) +
              PausedMarker(w->paused_minutes) + " (" +
              FormatHourMinute(b.cumulative_work_minutes) + ")" +
              DayMarker(b.end.Day() - b.start.Day(), "  ");
    } else {
      line += "Break: " +
              FormatHourMinute(std::get<wtcore::Break>(b.cycle).minutes);
    }
    lines.push_back(line);
  }

  if (auto open = wtcore::OpenCycle(t, now)) {
    const int64_t open_days = MinutesBetween(open->start, now) / kMinutesPerDay;
    lines.push_back(Index(open->index) + ". [" + open->start.ToTimeOfDay() +
                    " => .....] Work" + (open->paused ? " (paused)" : "") +
                    ": " + FormatHourMinute(open->work_minutes) +
                    PausedMarker(open->paused_minutes) + " (" +
                    FormatHourMinute(open->cumulative_work_minutes) + ")" +
                    DayMarker(open_days, "  "));
  }
  return lines;
}

std::string RenderCheck(const wtcore::Timer& t, const wtcore::Timestamp& now) {
  const wtcore::Totals totals = wtcore::ComputeTotals(t, now);

  std::string current = "--:--";
  int paused = 0;
  if (auto open = wtcore::OpenCycle(t, now)) {
    current = wtcore::FormatHourMinuteSpaced(open->work_minutes);
    paused = open->paused_minutes;
  }

  std::string status = wtcore::ToString(t.status);
  for (char& c : status) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  return current + " " + status + PausedMarker(paused) + " (" +
         wtcore::FormatHourMinuteSpaced(totals.work_minutes) + ")";
}

std::string RenderReport(const wtcore::Timer& t,
                         const wtcore::Timestamp& now) {
  if (!t.anchor_time) return "No work recorded today.";

  const wtcore::Totals totals = wtcore::ComputeTotals(t, now);
  return totals.start.ToDate() + " | " + totals.start.ToTimeOfDay() +
         " -> " + totals.end.ToTimeOfDay() +
         " | Work: " + FormatHourMinute(totals.work_minutes) +
         " | Break: " + FormatHourMinute(totals.break_minutes) +
         " | Paused: " + FormatHourMinute(totals.paused_minutes) +
         " | Total: " + FormatHourMinute(totals.elapsed_minutes) +
         DayMarker(totals.day_offset, " ");
}

std::string RenderModUsage() {
  return "Usage:\n"
         "  wt mod start <add|sub> <time>       - adjust day start time\n"
         "  wt mod <num> <add|sub> <time>       - adjust cycle duration\n"
         "  wt mod <num> pause <add|sub> <time> - adjust paused time\n"
         "  wt mod <num> drop                   - remove cycle";
}

}  // namespace wtcli
