// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/clocksim.h
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

#ifndef CLOCK_CLOCKSIM_H_
#define CLOCK_CLOCKSIM_H_

#include <cstdint>

/*
 * ClockSim models a physical clock that runs fast (drift_rate > 0) or slow
 * (drift_rate < 0) by drift_rate microseconds per real second, and that is
 * resynchronized to real time every 1/sync_freq seconds.
 *
 * Resynchronization is lazy: it happens inside GetTime() when a sync
 * interval has passed since the last one. It is idealized. The offset is
 * corrected exactly and the uncertainty bound stays at its configured value.
 * A real protocol (NTP-like) would estimate the offset from round-trip
 * probes, and the uncertainty would grow with the time since the last sync.
 * Neither is modeled here.
 *
 * Units: drift_rate in us/s, uncertainty_bound in us, sync_freq in Hz,
 * GetTime() in us since the clock was created.
 *
 * Not thread-safe; callers must serialize access.
 */
class ClockSim {
 public:
  ClockSim(double driftRate, double uncertaintyBound, double syncFreq);
  ~ClockSim() = default;

  // Logical time in microseconds. Never decreases between calls.
  uint64_t GetTime();

  // True time is within [GetTime() - e, GetTime() + e].
  inline double GetUncertainty() const { return uncertaintyBound; }

  inline double GetDriftRate() const { return driftRate; }
  inline uint64_t GetSyncIntervalUs() const { return syncIntervalUs; }

  void Synchronize();

 private:
  static uint64_t NowUs();
  void Synchronize(uint64_t now);

  const double driftRate;
  const double uncertaintyBound;
  uint64_t syncIntervalUs;

  uint64_t startUs;
  uint64_t baseOffset;  // logical time at the last sync
  uint64_t lastSyncUs;
  uint64_t lastTime;    // last value returned by GetTime()
};

#endif  // CLOCK_CLOCKSIM_H_
