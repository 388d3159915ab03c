// Copyright (c) 2025 <Your Name>
/**
 * @test Timeline projection
 * @brief Derived cycle boundaries and totals.
 * @steps
 *  1) Build timers directly (no transitions) with mixed Work/Break cycles.
 *  2) Project boundaries, the open cycle and day totals.
 * @expected
 *  - Consecutive boundaries touch; the first starts at the anchor.
 *  - Repeated projection yields identical values.
 *  - Live values account for folded and in-progress pause time.
 */
#include "wtcore/projection.hpp"

#include <gtest/gtest.h>

#include <vector>

using wtcore::Break;
using wtcore::Timer;
using wtcore::TimerStatus;
using wtcore::Timestamp;
using wtcore::Work;

namespace {

Timestamp At(int h, int m) { return Timestamp::FromCivil(2025, 1, 6, h, m); }

Timer StoppedDay() {
  Timer t;
  t.anchor_time = At(9, 0);
  t.timeline = {Work{30, 0}, Break{15}, Work{15, 10}, Break{0}, Work{5, 0}};
  t.last_stop_time = At(10, 20);
  return t;
}

}  // namespace

TEST(ProjectionTest, ContiguousForEveryPrefix) {
  const Timer full = StoppedDay();
  for (size_t k = 0; k <= full.timeline.size(); ++k) {
    Timer prefix = full;
    prefix.timeline.resize(k);

    int64_t sum = 0;
    for (const wtcore::Cycle& c : prefix.timeline) sum += wtcore::Duration(c);
    EXPECT_EQ(wtcore::CycleStart(prefix), *prefix.anchor_time + sum);

    const auto bounds = wtcore::EntryBoundaries(prefix);
    ASSERT_EQ(bounds.size(), k);
    if (k == 0) continue;
    EXPECT_EQ(bounds.front().start, *prefix.anchor_time);
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
      EXPECT_EQ(bounds[i].end, bounds[i + 1].start) << "prefix " << k;
    }
    EXPECT_EQ(bounds.back().end, wtcore::CycleStart(prefix));
  }
}

TEST(ProjectionTest, BoundariesOfKnownDay) {
  const auto b = wtcore::EntryBoundaries(StoppedDay());
  ASSERT_EQ(b.size(), 5u);
  EXPECT_EQ(b[0].end, At(9, 30));
  EXPECT_EQ(b[1].end, At(9, 45));
  // Paused time is part of a Work cycle's span.
  EXPECT_EQ(b[2].end, At(10, 10));
  EXPECT_EQ(b[3].start, b[3].end);
  EXPECT_EQ(b[4].end, At(10, 15));
  EXPECT_EQ(b[2].cumulative_work_minutes, 45);
  EXPECT_EQ(b[4].cumulative_work_minutes, 50);
  EXPECT_EQ(b[4].index, 5u);
}

TEST(ProjectionTest, IsPure) {
  const Timer t = StoppedDay();
  const Timestamp now = At(11, 0);

  const auto a = wtcore::EntryBoundaries(t);
  const auto b = wtcore::EntryBoundaries(t);
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].start, b[i].start);
    EXPECT_EQ(a[i].end, b[i].end);
    EXPECT_EQ(a[i].cycle, b[i].cycle);
  }

  const wtcore::Totals x = wtcore::ComputeTotals(t, now);
  const wtcore::Totals y = wtcore::ComputeTotals(t, now);
  EXPECT_EQ(x.work_minutes, y.work_minutes);
  EXPECT_EQ(x.end, y.end);
}

TEST(ProjectionTest, StoppedTotals) {
  const wtcore::Totals t = wtcore::ComputeTotals(StoppedDay(), At(12, 0));
  EXPECT_EQ(t.work_minutes, 50);
  EXPECT_EQ(t.break_minutes, 15);
  EXPECT_EQ(t.paused_minutes, 10);
  EXPECT_EQ(t.elapsed_minutes, 75);
  EXPECT_EQ(t.start, At(9, 0));
  EXPECT_EQ(t.end, At(10, 15));
  EXPECT_EQ(t.day_offset, 0);
  EXPECT_FALSE(wtcore::OpenCycle(StoppedDay(), At(12, 0)).has_value());
}

/**
 * @test ProjectionTest.RunningCycleTotals
 * @brief The open cycle contributes live work and folded pause time.
 * @steps Running since 09:45 with 5 folded pause minutes; now 10:05.
 * @expected Live work 15; end = cycle start + live work.
 */
TEST(ProjectionTest, RunningCycleTotals) {
  Timer t;
  t.status = TimerStatus::kRunning;
  t.anchor_time = At(9, 0);
  t.timeline = {Work{30, 0}, Break{15}};
  t.live_paused_minutes = 5;
  const Timestamp now = At(10, 5);

  EXPECT_EQ(wtcore::LivePausedMinutes(t, now), 5);
  EXPECT_EQ(wtcore::LiveElapsedWorkMinutes(t, now), 15);

  const auto open = wtcore::OpenCycle(t, now);
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->index, 3u);
  EXPECT_EQ(open->start, At(9, 45));
  EXPECT_EQ(open->work_minutes, 15);
  EXPECT_EQ(open->cumulative_work_minutes, 45);
  EXPECT_FALSE(open->paused);

  const wtcore::Totals totals = wtcore::ComputeTotals(t, now);
  EXPECT_EQ(totals.work_minutes, 45);
  EXPECT_EQ(totals.break_minutes, 15);
  EXPECT_EQ(totals.paused_minutes, 5);
  EXPECT_EQ(totals.elapsed_minutes, 65);
  EXPECT_EQ(totals.end, At(10, 0));
}

TEST(ProjectionTest, PausedCycleCountsInProgressPause) {
  Timer t;
  t.status = TimerStatus::kPaused;
  t.anchor_time = At(9, 0);
  t.live_paused_minutes = 5;
  t.pause_start_time = At(9, 40);
  const Timestamp now = At(9, 50);

  EXPECT_EQ(wtcore::LivePausedMinutes(t, now), 15);
  EXPECT_EQ(wtcore::LiveElapsedWorkMinutes(t, now), 35);
  const auto open = wtcore::OpenCycle(t, now);
  ASSERT_TRUE(open.has_value());
  EXPECT_TRUE(open->paused);
  EXPECT_EQ(open->paused_minutes, 15);
}

TEST(ProjectionTest, DayOffsetAcrossMidnight) {
  Timer t;
  t.anchor_time = At(23, 0);
  t.timeline = {Work{90, 0}};
  const wtcore::Totals totals = wtcore::ComputeTotals(t, At(23, 0) + 120);
  EXPECT_EQ(totals.end.ToString(), "2025-01-07 00:30");
  EXPECT_EQ(totals.day_offset, 1);
}
