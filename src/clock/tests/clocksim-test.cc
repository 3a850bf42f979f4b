// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/tests/clocksim-test.cc
 *   Tests for the simulated drifting clock
 *
 * Copyright 2018-2023 Matthew Burke <matthelb@cs.cornell.edu>
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 **********************************************************************/

#include <unistd.h>

#include <cstdint>
#include <vector>

#include "clock/clocksim.h"
#include "gtest/gtest.h"

namespace {

void SleepMs(uint64_t ms) { usleep(ms * 1000); }

}  // namespace

TEST(ClockSim, MonotonicWithoutDrift) {
  ClockSim clock(0.0, 0.0, 10000.0);
  uint64_t t1 = clock.GetTime();
  SleepMs(2);
  uint64_t t2 = clock.GetTime();
  EXPECT_GE(t2, t1);
}

TEST(ClockSim, AdvancesWithRealTime) {
  // Sync every 100ms, no drift: the clock tracks real time.
  ClockSim clock(0.0, 10.0, 10.0);
  uint64_t t1 = clock.GetTime();
  SleepMs(20);
  uint64_t t2 = clock.GetTime();
  EXPECT_GE(t2 - t1, 20000UL);
  EXPECT_LT(t2 - t1, 1000000UL);
}

TEST(ClockSim, SynchronizationBoundsLargeDrift) {
  // 100ms/s drift, sync every 500ms.
  ClockSim clock(100000.0, 0.0, 2.0);

  SleepMs(300);
  uint64_t beforeSync = clock.GetTime();

  SleepMs(350);
  uint64_t afterSync = clock.GetTime();

  // The second read resyncs to real time, so the delta is close to 350ms
  // rather than growing with the accumulated drift.
  uint64_t delta = afterSync > beforeSync ? afterSync - beforeSync : 0;
  EXPECT_LT(delta, 500000UL);
}

TEST(ClockSim, EqualsRealElapsedTimeAfterResync) {
  ClockSim clock(0.0, 0.0, 1.0);
  SleepMs(10);
  clock.Synchronize();
  uint64_t t = clock.GetTime();
  EXPECT_GE(t, 10000UL);
  EXPECT_LT(t, 1000000UL);
}

TEST(ClockSim, NegativeDriftStaysMonotonic) {
  // The drift term alone would make this clock run backwards.
  ClockSim clock(-2000000.0, 0.0, 1.0);
  std::vector<uint64_t> reads;
  for (int i = 0; i < 50; ++i) {
    reads.push_back(clock.GetTime());
    usleep(200);
  }
  for (size_t i = 1; i < reads.size(); ++i) {
    EXPECT_GE(reads[i], reads[i - 1]);
  }
}

TEST(ClockSim, FastClockDoesNotStepBackOnResync) {
  ClockSim clock(500000.0, 0.0, 20.0);
  uint64_t prev = clock.GetTime();
  for (int i = 0; i < 20; ++i) {
    SleepMs(10);
    uint64_t t = clock.GetTime();
    EXPECT_GE(t, prev);
    prev = t;
  }
}

TEST(ClockSim, ReportsUncertainty) {
  ClockSim clock(50.0, 123.5, 100.0);
  EXPECT_DOUBLE_EQ(clock.GetUncertainty(), 123.5);
  EXPECT_DOUBLE_EQ(clock.GetDriftRate(), 50.0);
  EXPECT_EQ(clock.GetSyncIntervalUs(), 10000UL);
}

TEST(ClockSimDeathTest, ZeroSyncFrequency) {
  EXPECT_DEATH(ClockSim(50.0, 100.0, 0.0), "sync_freq must be > 0.0");
}

TEST(ClockSimDeathTest, NegativeSyncFrequency) {
  EXPECT_DEATH(ClockSim(50.0, 100.0, -1.0), "sync_freq must be > 0.0");
}

TEST(ClockSimDeathTest, SyncIntervalOutOfRange) {
  EXPECT_DEATH(ClockSim(50.0, 100.0, 1e-15), "sync interval too long");
}

TEST(ClockSim, SmallSyncFrequency) {
  // One sync every ~11.6 days still fits.
  ClockSim clock(0.0, 0.0, 1e-6);
  EXPECT_EQ(clock.GetSyncIntervalUs(), 1000000000000UL);
  EXPECT_LE(clock.GetTime(), 1000000UL);
}
