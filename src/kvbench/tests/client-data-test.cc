// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/tests/client-data-test.cc
 *   Tests for the per-request ledger
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
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "kvbench/client_data.h"

namespace kvbench {

namespace {

std::vector<std::string> ReadLines(const std::string &path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST(ClientData, DenseIds) {
  ClientData data;
  EXPECT_EQ(data.NewRequest(true), 0UL);
  EXPECT_EQ(data.NewRequest(false), 1UL);
  EXPECT_EQ(data.NewRequest(false), 2UL);
  EXPECT_EQ(data.RequestCount(), 3UL);
  EXPECT_EQ(data.ResponseCount(), 0UL);
}

TEST(ClientData, ResponsesOutOfOrder) {
  ClientData data;
  for (int i = 0; i < 5; ++i) {
    data.NewRequest(i % 2 == 0);
  }
  data.NewResponse(3);
  data.NewResponse(0);
  data.NewResponse(4);
  EXPECT_EQ(data.ResponseCount(), 3UL);
  EXPECT_EQ(data.RequestCount(), 5UL);
  EXPECT_EQ(data.Latencies().size(), 3UL);
}

TEST(ClientData, DuplicateResponseIgnored) {
  ClientData data;
  data.NewRequest(false);
  data.NewRequest(false);
  data.NewResponse(1);
  data.NewResponse(1);
  EXPECT_EQ(data.ResponseCount(), 1UL);
  EXPECT_EQ(data.Latencies().size(), 1UL);
}

TEST(ClientData, UnknownIdDies) {
  ClientData data;
  data.NewRequest(true);
  EXPECT_DEATH(data.NewResponse(1), "Assertion failed");
}

TEST(ClientData, CSVShape) {
  ClientData data;
  data.NewRequest(true);
  data.NewRequest(false);
  data.NewRequest(true);
  data.NewResponse(0);
  data.NewResponse(2);

  std::string path = "/tmp/kvbench-" + std::to_string(getpid()) + "-data.csv";
  ASSERT_TRUE(data.WriteCSV(path));
  std::vector<std::string> lines = ReadLines(path);
  std::remove(path.c_str());

  ASSERT_EQ(lines.size(), 4UL);
  EXPECT_EQ(lines[0], "send_time,is_write,receive_time");

  // Unanswered request: empty receive time.
  EXPECT_NE(lines[2].find(",false,"), std::string::npos);
  EXPECT_EQ(lines[2].back(), ',');

  for (size_t i : {1UL, 3UL}) {
    size_t first = lines[i].find(',');
    size_t second = lines[i].find(',', first + 1);
    ASSERT_NE(second, std::string::npos);
    EXPECT_EQ(lines[i].substr(first + 1, second - first - 1), "true");
    int64_t sent = std::stoll(lines[i].substr(0, first));
    int64_t received = std::stoll(lines[i].substr(second + 1));
    EXPECT_GE(received, sent);
  }
}

TEST(ClientData, EmptyCSVHasHeader) {
  ClientData data;
  std::string path =
      "/tmp/kvbench-" + std::to_string(getpid()) + "-empty.csv";
  ASSERT_TRUE(data.WriteCSV(path));
  std::vector<std::string> lines = ReadLines(path);
  std::remove(path.c_str());
  ASSERT_EQ(lines.size(), 1UL);
  EXPECT_EQ(lines[0], "send_time,is_write,receive_time");
}

TEST(ClientData, UnwritableCSV) {
  ClientData data;
  data.NewRequest(true);
  EXPECT_FALSE(data.WriteCSV("/nonexistent-dir/data.csv"));
}

}  // namespace kvbench
