// Copyright (c) 2025 <Your Name>
/**
 * @file cycle.hpp
 * @brief Timeline entries: a Work or a Break interval.
 */
#pragma once

#include <variant>

namespace wtcore {

/** Completed work interval. */
struct Work {
  int minutes = 0;         ///< Actual work time (excludes paused time)
  int paused_minutes = 0;  ///< Time suspended within this cycle
};

/** Completed break interval. */
struct Break {
  int minutes = 0;
};

/** One timeline entry. */
using Cycle = std::variant<Work, Break>;

inline bool operator==(const Work& a, const Work& b) {
  return a.minutes == b.minutes && a.paused_minutes == b.paused_minutes;
}
inline bool operator!=(const Work& a, const Work& b) { return !(a == b); }
inline bool operator==(const Break& a, const Break& b) {
  return a.minutes == b.minutes;
}
inline bool operator!=(const Break& a, const Break& b) { return !(a == b); }

/** Wall-clock length of the entry (work + paused for Work). */
int Elapsed(const Cycle& c);

/** Minutes the entry advances the projected clock by. */
int Duration(const Cycle& c);

inline bool IsWork(const Cycle& c) { return std::holds_alternative<Work>(c); }
inline bool IsBreak(const Cycle& c) { return std::holds_alternative<Break>(c); }

}  // namespace wtcore
