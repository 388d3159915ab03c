// Copyright (c) 2025 <Your Name>
/**
 * @file timer_codec.hpp
 * @brief JSON encoding of the persisted Timer aggregate.
 *
 * Layout (object, 4-space indented on write):
 *
 *   - status:            "stopped" | "running" | "paused"
 *   - pause_start_str:   "YYYY-MM-DD HH:MM" while paused, else ""
 *   - stop_datetime_str: "YYYY-MM-DD HH:MM" after a stop, else ""
 *   - paused_minutes:    pause time folded into the open cycle
 *   - mode:              "silent" | "normal" | "verbose"
 *   - timeline:          [{type: "work"|"break", minutes, paused_minutes?}]
 *   - day_start:         anchor time, "" before the first start
 *
 * Files written by older releases may carry `accumulated_minutes` in place
 * of `paused_minutes`; Parse() migrates it.
 */
#pragma once

#include <string>

#include "wtcore/timer.hpp"

namespace wtcli {

/** @brief Timer <-> JSON text. */
struct TimerCodec {
  /**
   * @brief Encode a Timer as indented JSON text.
   * @param t Timer to encode.
   * @return JSON document (no trailing newline).
   */
  static std::string Serialize(const wtcore::Timer& t);

  /**
   * @brief Decode JSON text into a Timer.
   * @param text JSON document.
   * @param out Decoded timer on success; untouched on failure.
   * @param err Reason on failure (may be nullptr).
   * @return true on success, false on malformed or inconsistent input.
   * @test
   * @brief A legacy `accumulated_minutes` field becomes the paused total.
   * @steps Parse a document carrying only `accumulated_minutes: 7`.
   * @expected live_paused_minutes == 7.
   */
  static bool Parse(const std::string& text, wtcore::Timer* out,
                    std::string* err);
};

}  // namespace wtcli
