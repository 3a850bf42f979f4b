// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/clock_config.h
 *   Parameters of the simulated clock, loaded from a file with
 *   environment variable overrides
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

#ifndef CLOCK_CLOCK_CONFIG_H_
#define CLOCK_CLOCK_CONFIG_H_

#include <istream>
#include <string>

#include <nlohmann/json.hpp>

/*
 * | Field             | Unit | Description                               |
 * |-------------------|------|-------------------------------------------|
 * | drift_rate        | us/s | drift per real second; (+) fast (-) slow  |
 * | uncertainty_bound | us   | +/- e after a sync                        |
 * | sync_freq         | Hz   | resyncs per second; interval = 1/freq     |
 *
 * File format: one "key = value" (or "key value") per line, '#' starts a
 * comment. Keys may appear at top level or inside a [clock] section; keys
 * inside any other section are ignored.
 */
struct ClockConfig {
  static constexpr double kDefaultDriftRate = 50.0;
  static constexpr double kDefaultUncertaintyBound = 100.0;
  static constexpr double kDefaultSyncFreq = 100.0;

  static constexpr const char *kDriftRateEnv = "KVBENCH_CLOCK_DRIFT_RATE";
  static constexpr const char *kUncertaintyBoundEnv =
      "KVBENCH_CLOCK_UNCERTAINTY_BOUND";
  static constexpr const char *kSyncFreqEnv = "KVBENCH_CLOCK_SYNC_FREQ";

  ClockConfig();
  // Panics on malformed input.
  explicit ClockConfig(std::istream &file);

  // Values from KVBENCH_CLOCK_* variables replace the current ones.
  void ApplyEnvironmentOverrides();

  nlohmann::json ToJSON() const;

  double drift_rate;
  double uncertainty_bound;
  double sync_freq;
};

#endif  // CLOCK_CLOCK_CONFIG_H_
