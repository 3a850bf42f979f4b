// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/tests/message-test.cc
 *   Tests for logging and assertion macros
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

#include "gtest/gtest.h"
#include "lib/assert.h"
#include "lib/message.h"

TEST(Message, WarningDoesNotAbort) {
  Notice("notice %d", 1);
  Warning("warning %s", "two");
  SUCCEED();
}

TEST(MessageDeathTest, PanicAborts) {
  EXPECT_DEATH(Panic("fatal %d", 42), "fatal 42");
}

TEST(MessageDeathTest, NotReachable) {
  EXPECT_DEATH(NOT_REACHABLE(), "Unreachable code reached");
}

TEST(MessageDeathTest, AssertFailure) {
  int x = 1;
  EXPECT_DEATH(UW_ASSERT(x == 2), "Assertion failed: x == 2");
  EXPECT_DEATH(UW_ASSERT_EQ(x, 3), "Assertion failed: x == 3");
}
