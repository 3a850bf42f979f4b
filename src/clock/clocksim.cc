// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/clocksim.cc
 *   A simulated loosely-synchronized clock with drift and periodic
 *   resynchronization
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

#include "clock/clocksim.h"

#include <time.h>

#include <cmath>
#include <limits>

#include "lib/message.h"

ClockSim::ClockSim(double driftRate, double uncertaintyBound, double syncFreq)
    : driftRate(driftRate), uncertaintyBound(uncertaintyBound) {
  if (!(syncFreq > 0.0)) {
    Panic("sync_freq must be > 0.0 (got %f)", syncFreq);
  }
  double intervalUs = std::ceil(1000000.0 / syncFreq);
  if (!(intervalUs <
        static_cast<double>(std::numeric_limits<uint64_t>::max()))) {
    Panic("sync_freq %g Hz gives a sync interval too long to represent",
          syncFreq);
  }
  syncIntervalUs = intervalUs < 1.0 ? 1 : static_cast<uint64_t>(intervalUs);

  startUs = NowUs();
  baseOffset = 0;
  lastSyncUs = startUs;
  lastTime = 0;

  Debug("ClockSim: drift=%f us/s uncertainty=%f us sync interval=%lu us",
        driftRate, uncertaintyBound, syncIntervalUs);
}

uint64_t ClockSim::NowUs() {
  struct timespec ts {};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000000ULL +
         static_cast<uint64_t>(ts.tv_nsec) / 1000ULL;
}

uint64_t ClockSim::GetTime() {
  uint64_t now = NowUs();
  if (now - lastSyncUs >= syncIntervalUs) {
    Synchronize(now);
  }

  double elapsed = static_cast<double>(now - lastSyncUs);
  double drift = (elapsed / 1000000.0) * driftRate;
  double simulated = static_cast<double>(baseOffset) + elapsed + drift;

  // A slow clock (or a fast clock stepped back by a resync) must not run
  // backwards.
  uint64_t t = simulated > 0.0 ? static_cast<uint64_t>(simulated) : 0;
  if (t < lastTime) {
    t = lastTime;
  }
  lastTime = t;
  return t;
}

void ClockSim::Synchronize() { Synchronize(NowUs()); }

void ClockSim::Synchronize(uint64_t now) {
  baseOffset = now - startUs;
  lastSyncUs = now;
}
