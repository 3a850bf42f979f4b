// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/tests/timeval-test.cc
 *   Tests for timeval helpers
 *
 * Copyright 2013 Dan R. K. Ports  <drkp@cs.washington.edu>
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

#include <sys/time.h>
#include <time.h>

#include <cstdint>

#include "gtest/gtest.h"
#include "lib/timeval.h"

TEST(Timeval, ToMs) {
  struct timeval tv {};
  tv.tv_sec = 1700000000;
  tv.tv_usec = 123999;
  EXPECT_EQ(timeval_to_ms(tv), 1700000000123LL);

  tv.tv_sec = 0;
  tv.tv_usec = 999;
  EXPECT_EQ(timeval_to_ms(tv), 0);
}

TEST(Timeval, NowMsTracksWallClock) {
  int64_t before = static_cast<int64_t>(time(nullptr)) * 1000;
  int64_t now = timeval_now_ms();
  int64_t after = (static_cast<int64_t>(time(nullptr)) + 1) * 1000;
  EXPECT_GE(now, before);
  EXPECT_LT(now, after);
  EXPECT_LE(now, timeval_now_ms());
}
