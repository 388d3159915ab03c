// Copyright (c) 2025 <Your Name>
#include "wtcore/timer.hpp"

namespace wtcore {

const char* ToString(TimerStatus s) {
  switch (s) {
    case TimerStatus::kStopped:
      return "stopped";
    case TimerStatus::kRunning:
      return "running";
    case TimerStatus::kPaused:
      return "paused";
  }
  return "stopped";
}

const char* ToString(Mode m) {
  switch (m) {
    case Mode::kSilent:
      return "silent";
    case Mode::kNormal:
      return "normal";
    case Mode::kVerbose:
      return "verbose";
  }
  return "silent";
}

bool ParseStatus(const std::string& text, TimerStatus* out) {
  if (out == nullptr) return false;
  if (text == "stopped") {
    *out = TimerStatus::kStopped;
  } else if (text == "running") {
    *out = TimerStatus::kRunning;
  } else if (text == "paused") {
    *out = TimerStatus::kPaused;
  } else {
    return false;
  }
  return true;
}

bool ParseMode(const std::string& text, Mode* out) {
  if (out == nullptr) return false;
  if (text == "silent") {
    *out = Mode::kSilent;
  } else if (text == "normal") {
    *out = Mode::kNormal;
  } else if (text == "verbose") {
    *out = Mode::kVerbose;
  } else {
    return false;
  }
  return true;
}

Timer MakeEmptyTimer(Mode mode) {
  Timer t;
  t.mode = mode;
  return t;
}

bool CheckInvariants(const Timer& timer, std::string* err) {
  auto fail = [err](const std::string& msg) {
    if (err) *err = msg;
    return false;
  };

  if (timer.live_paused_minutes < 0) return fail("negative paused minutes");
  for (size_t i = 0; i < timer.timeline.size(); ++i) {
    const Cycle& c = timer.timeline[i];
    bool negative = false;
    if (const Work* w = std::get_if<Work>(&c)) {
      negative = w->minutes < 0 || w->paused_minutes < 0;
    } else if (const Break* b = std::get_if<Break>(&c)) {
      negative = b->minutes < 0;
    }
    if (negative) {
      return fail("negative minutes in cycle " + std::to_string(i + 1));
    }
  }
  if ((timer.status == TimerStatus::kPaused) !=
      timer.pause_start_time.has_value()) {
    return fail("pause start must be present exactly while paused");
  }
  if (timer.last_stop_time && timer.status != TimerStatus::kStopped) {
    return fail("stop time present while a cycle is open");
  }
  if (!timer.anchor_time && (timer.IsOpen() || !timer.timeline.empty())) {
    return fail("missing day start");
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, const Timer& t) {
  os << "status = " << ToString(t.status) << "\n"
     << "day_start = " << (t.anchor_time ? t.anchor_time->ToString() : "")
     << "\n"
     << "pause_start = "
     << (t.pause_start_time ? t.pause_start_time->ToString() : "") << "\n"
     << "stop_time = "
     << (t.last_stop_time ? t.last_stop_time->ToString() : "") << "\n"
     << "paused_minutes = " << t.live_paused_minutes << "\n"
     << "mode = " << ToString(t.mode) << "\n"
     << "timeline = [";
  for (size_t i = 0; i < t.timeline.size(); ++i) {
    if (i != 0) os << ", ";
    if (const Work* w = std::get_if<Work>(&t.timeline[i])) {
      os << "work " << w->minutes;
      if (w->paused_minutes > 0) os << "|" << w->paused_minutes;
    } else {
      os << "break " << std::get<Break>(t.timeline[i]).minutes;
    }
  }
  os << "]";
  return os;
}

}  // namespace wtcore
