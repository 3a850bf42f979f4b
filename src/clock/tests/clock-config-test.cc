// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/tests/clock-config-test.cc
 *   Tests for loading clock parameters
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

#include <stdlib.h>

#include <sstream>
#include <string>

#include "clock/clock_config.h"
#include "clock/clocksim.h"
#include "gtest/gtest.h"

class ClockConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    unsetenv(ClockConfig::kDriftRateEnv);
    unsetenv(ClockConfig::kUncertaintyBoundEnv);
    unsetenv(ClockConfig::kSyncFreqEnv);
  }
};

TEST_F(ClockConfigTest, Defaults) {
  ClockConfig config;
  EXPECT_DOUBLE_EQ(config.drift_rate, 50.0);
  EXPECT_DOUBLE_EQ(config.uncertainty_bound, 100.0);
  EXPECT_DOUBLE_EQ(config.sync_freq, 100.0);
}

TEST_F(ClockConfigTest, FlatFile) {
  std::istringstream file(
      "# clock parameters\n"
      "drift_rate = 25\n"
      "uncertainty_bound = 50.0\n"
      "\n"
      "sync_freq 200   # Hz\n");
  ClockConfig config(file);
  EXPECT_DOUBLE_EQ(config.drift_rate, 25.0);
  EXPECT_DOUBLE_EQ(config.uncertainty_bound, 50.0);
  EXPECT_DOUBLE_EQ(config.sync_freq, 200.0);

  ClockSim clock(config.drift_rate, config.uncertainty_bound,
                 config.sync_freq);
  uint64_t t1 = clock.GetTime();
  uint64_t t2 = clock.GetTime();
  EXPECT_GE(t2, t1);
  EXPECT_DOUBLE_EQ(clock.GetUncertainty(), 50.0);
}

TEST_F(ClockConfigTest, ClockSectionOnly) {
  std::istringstream file(
      "[server]\n"
      "sync_freq = 1\n"
      "[clock]\n"
      "drift_rate = -10\n"
      "sync_freq = 1000\n");
  ClockConfig config(file);
  EXPECT_DOUBLE_EQ(config.drift_rate, -10.0);
  EXPECT_DOUBLE_EQ(config.uncertainty_bound, 100.0);
  EXPECT_DOUBLE_EQ(config.sync_freq, 1000.0);
}

TEST_F(ClockConfigTest, EnvironmentOverridesFile) {
  std::istringstream file("drift_rate = 25\nsync_freq = 200\n");
  ClockConfig config(file);
  setenv(ClockConfig::kDriftRateEnv, "75.5", 1);
  setenv(ClockConfig::kUncertaintyBoundEnv, "10", 1);
  config.ApplyEnvironmentOverrides();
  EXPECT_DOUBLE_EQ(config.drift_rate, 75.5);
  EXPECT_DOUBLE_EQ(config.uncertainty_bound, 10.0);
  EXPECT_DOUBLE_EQ(config.sync_freq, 200.0);
}

TEST_F(ClockConfigTest, ToJSON) {
  ClockConfig config;
  config.sync_freq = 10.0;
  nlohmann::json j = config.ToJSON();
  EXPECT_DOUBLE_EQ(j["drift_rate"].get<double>(), 50.0);
  EXPECT_DOUBLE_EQ(j["uncertainty_bound"].get<double>(), 100.0);
  EXPECT_DOUBLE_EQ(j["sync_freq"].get<double>(), 10.0);
}

TEST_F(ClockConfigTest, UnknownKeyDies) {
  EXPECT_DEATH(
      {
        std::istringstream file("drift = 1\n");
        ClockConfig config(file);
      },
      "unknown key");
}

TEST_F(ClockConfigTest, MalformedNumberDies) {
  EXPECT_DEATH(
      {
        std::istringstream file("sync_freq = fast\n");
        ClockConfig config(file);
      },
      "invalid number");
}

TEST_F(ClockConfigTest, MalformedEnvironmentDies) {
  setenv(ClockConfig::kSyncFreqEnv, "often", 1);
  ClockConfig config;
  EXPECT_DEATH(config.ApplyEnvironmentOverrides(), "Invalid value");
}
