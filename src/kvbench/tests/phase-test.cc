// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/tests/phase-test.cc
 *   Tests for workload phase parsing
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

#include <vector>

#include "gtest/gtest.h"
#include "kvbench/phase.h"

namespace kvbench {

TEST(ParsePhases, Empty) {
  std::vector<Phase> phases{Phase{1, 0.5, 1}};
  EXPECT_TRUE(ParsePhases("", &phases));
  EXPECT_TRUE(phases.empty());
}

TEST(ParsePhases, Single) {
  std::vector<Phase> phases;
  ASSERT_TRUE(ParsePhases("1000:0.9:500", &phases));
  ASSERT_EQ(phases.size(), 1UL);
  EXPECT_EQ(phases[0].duration_ms, 1000UL);
  EXPECT_DOUBLE_EQ(phases[0].read_ratio, 0.9);
  EXPECT_EQ(phases[0].request_delay_us, 500UL);
}

TEST(ParsePhases, Multiple) {
  std::vector<Phase> phases;
  ASSERT_TRUE(ParsePhases("100:0:10,200:1:20,300:0.5:30", &phases));
  ASSERT_EQ(phases.size(), 3UL);
  EXPECT_EQ(phases[1].duration_ms, 200UL);
  EXPECT_DOUBLE_EQ(phases[1].read_ratio, 1.0);
  EXPECT_EQ(phases[2].request_delay_us, 30UL);
}

TEST(ParsePhases, ZeroDurationAllowed) {
  std::vector<Phase> phases;
  ASSERT_TRUE(ParsePhases("0:0.5:10", &phases));
  EXPECT_EQ(phases[0].duration_ms, 0UL);
}

TEST(ParsePhases, Rejects) {
  std::vector<Phase> phases;
  EXPECT_FALSE(ParsePhases("100:1.5:10", &phases));
  EXPECT_FALSE(ParsePhases("100:-0.1:10", &phases));
  EXPECT_FALSE(ParsePhases("100:0.5:0", &phases));
  EXPECT_FALSE(ParsePhases("100:0.5", &phases));
  EXPECT_FALSE(ParsePhases("100:0.5:10:", &phases));
  EXPECT_FALSE(ParsePhases("abc:0.5:10", &phases));
  EXPECT_FALSE(ParsePhases("-5:0.5:10", &phases));
  EXPECT_FALSE(ParsePhases("100:half:10", &phases));
  EXPECT_FALSE(ParsePhases("100:0.5:10,", &phases));
  EXPECT_FALSE(ParsePhases("100:0.5:10,,100:0.5:10", &phases));
}

TEST(Phase, ToJSON) {
  nlohmann::json j = Phase{100, 0.25, 40}.ToJSON();
  EXPECT_EQ(j["duration_ms"], 100);
  EXPECT_DOUBLE_EQ(j["read_ratio"].get<double>(), 0.25);
  EXPECT_EQ(j["request_delay_us"], 40);
}

}  // namespace kvbench
