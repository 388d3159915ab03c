// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Merge rules applied when a completed cycle is removed.
 *
 * Removing an entry must leave a contiguous timeline whose total elapsed
 * time only changes by reclassifying the dropped interval:
 *
 *   Break between two Works     -> one Work; the break becomes work time.
 *   Last Break while open,
 *   preceded by Work            -> both fold into the open cycle.
 *   Other Breaks                -> removed.
 *   Work between two Breaks     -> one Break; the work becomes break time.
 *   Work next to one Break      -> its elapsed time joins that Break.
 *   Work with no Break nearby   -> replaced by a Break of its elapsed time.
 */

#pragma once

#include <cstddef>
#include <string>

#include "wtcore/timer.hpp"
#include "wtcore/timestamp.hpp"

namespace wtcore {
namespace internal {

/** What a drop did, for the caller's message. */
struct DropResult {
  enum class Merge {
    kNone,            ///< Plain removal
    kWorkCycles,      ///< Break removed, neighbouring Works joined
    kRunningCycle,    ///< Last Break and its Work folded into the open cycle
    kBreaks,          ///< Work removed, neighbouring Breaks joined
    kPreviousBreak,   ///< Work time added to the preceding Break
    kNextBreak,       ///< Work time added to the following Break
    kConvertedBreak,  ///< Work replaced by a Break of the same length
  };

  Merge merge = Merge::kNone;
  /** Minutes of the joined entry; work time of the open cycle for
   *  kRunningCycle. */
  int merged_minutes = 0;
};

/**
 * @brief Remove timeline[pos] and merge its neighbours.
 * @param timer Aggregate to edit; pos must be < timeline.size().
 * @param pos 0-based position.
 * @param now Current time, for the open cycle's work time.
 * @return Which merge rule applied.
 */
DropResult DropAndMerge(Timer* timer, size_t pos, const Timestamp& now);

/** Message suffix such as " (merged adjacent breaks: 0h:20m)". */
std::string DescribeMerge(const DropResult& result);

}  // namespace internal
}  // namespace wtcore
