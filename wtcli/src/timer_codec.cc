// Copyright (c) 2025 <Your Name>
#include "wtcli/timer_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace wtcli {

namespace {

using nlohmann::json;
using nlohmann::ordered_json;

std::string EncodeTime(const std::optional<wtcore::Timestamp>& t) {
  return t ? t->ToString() : std::string();
}

bool DecodeTime(const json& j, const char* key,
                std::optional<wtcore::Timestamp>* out, std::string* err) {
  const std::string text = j.value(key, std::string());
  if (text.empty()) {
    out->reset();
    return true;
  }
  wtcore::Timestamp t;
  if (!wtcore::Timestamp::Parse(text, &t)) {
    *err = std::string("bad timestamp in ") + key + ": " + text;
    return false;
  }
  *out = t;
  return true;
}

// Absent reads as 0; anything but an integer in int range is rejected.
bool DecodeMinutes(const json& j, const char* key, int* out,
                   std::string* err) {
  auto it = j.find(key);
  if (it == j.end()) {
    *out = 0;
    return true;
  }
  if (!it->is_number_integer()) {
    *err = std::string(key) + " is not an integer";
    return false;
  }
  const int64_t v = it->is_number_unsigned()
                        ? static_cast<int64_t>(std::min<uint64_t>(
                              it->get<uint64_t>(),
                              std::numeric_limits<int64_t>::max()))
                        : it->get<int64_t>();
  if (v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max()) {
    *err = std::string(key) + " is out of range";
    return false;
  }
  *out = static_cast<int>(v);
  return true;
}

bool DecodeCycle(const json& e, wtcore::Cycle* out, std::string* err) {
  const std::string type = e.value("type", std::string());
  int minutes = 0;
  int paused = 0;
  if (!DecodeMinutes(e, "minutes", &minutes, err) ||
      !DecodeMinutes(e, "paused_minutes", &paused, err)) {
    return false;
  }
  if (minutes < 0 || paused < 0) {
    *err = "negative minutes in timeline entry";
    return false;
  }
  if (type == "work") {
    *out = wtcore::Work{minutes, paused};
  } else if (type == "break") {
    *out = wtcore::Break{minutes};
  } else {
    *err = "unknown timeline entry type: " + type;
    return false;
  }
  return true;
}

// Older files stored the open cycle's pause total as accumulated_minutes.
void MigrateLegacyFields(const json& j, wtcore::Timer* t) {
  if (t->live_paused_minutes != 0) return;
  int legacy = 0;
  std::string ignored;
  if (DecodeMinutes(j, "accumulated_minutes", &legacy, &ignored)) {
    t->live_paused_minutes = legacy;
  }
}

}  // namespace

std::string TimerCodec::Serialize(const wtcore::Timer& t) {
  ordered_json timeline = ordered_json::array();
  for (const wtcore::Cycle& c : t.timeline) {
    ordered_json e;
    if (const wtcore::Work* w = std::get_if<wtcore::Work>(&c)) {
      e["type"] = "work";
      e["minutes"] = w->minutes;
      if (w->paused_minutes != 0) e["paused_minutes"] = w->paused_minutes;
    } else {
      e["type"] = "break";
      e["minutes"] = std::get<wtcore::Break>(c).minutes;
    }
    timeline.push_back(e);
  }

  ordered_json j;
  j["status"] = wtcore::ToString(t.status);
  j["pause_start_str"] = EncodeTime(t.pause_start_time);
  j["stop_datetime_str"] = EncodeTime(t.last_stop_time);
  j["paused_minutes"] = t.live_paused_minutes;
  j["mode"] = wtcore::ToString(t.mode);
  j["timeline"] = timeline;
  j["day_start"] = EncodeTime(t.anchor_time);
  return j.dump(4);
}

bool TimerCodec::Parse(const std::string& text, wtcore::Timer* out,
                       std::string* err) {
  std::string reason;
  auto fail = [&](const std::string& msg) {
    if (err) *err = "Cannot decode timer: " + msg;
    return false;
  };
  if (out == nullptr) return fail("no output");

  const json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) return fail("malformed JSON");
  if (!j.is_object()) return fail("expected an object");

  wtcore::Timer t;
  try {
    if (!wtcore::ParseStatus(j.value("status", std::string("stopped")),
                             &t.status)) {
      return fail("bad status");
    }
    const std::string mode = j.value("mode", std::string());
    if (!mode.empty() && !wtcore::ParseMode(mode, &t.mode)) {
      return fail("bad mode: " + mode);
    }
    if (!DecodeMinutes(j, "paused_minutes", &t.live_paused_minutes,
                       &reason)) {
      return fail(reason);
    }
    MigrateLegacyFields(j, &t);

    if (!DecodeTime(j, "day_start", &t.anchor_time, &reason)) {
      return fail(reason);
    }
    // Older writers left these set outside the status they belong to.
    if (t.status == wtcore::TimerStatus::kPaused &&
        !DecodeTime(j, "pause_start_str", &t.pause_start_time, &reason)) {
      return fail(reason);
    }
    if (t.status == wtcore::TimerStatus::kStopped &&
        !DecodeTime(j, "stop_datetime_str", &t.last_stop_time, &reason)) {
      return fail(reason);
    }

    auto it = j.find("timeline");
    if (it != j.end() && !it->is_null()) {
      if (!it->is_array()) return fail("timeline is not an array");
      for (const json& e : *it) {
        wtcore::Cycle c;
        if (!DecodeCycle(e, &c, &reason)) return fail(reason);
        t.timeline.push_back(c);
      }
    }
  } catch (const json::exception& e) {
    return fail(e.what());
  }

  if (!wtcore::CheckInvariants(t, &reason)) return fail(reason);
  *out = std::move(t);
  return true;
}

}  // namespace wtcli
