// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * correctness/tests/operation-history-test.cc
 *   Tests for the operation history recorder
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
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "correctness/operation_history.h"
#include "gtest/gtest.h"

namespace correctness {

namespace {

std::string TempPath(const std::string &name) {
  return "/tmp/kvbench-" + std::to_string(getpid()) + "-" + name;
}

nlohmann::json ReadJSON(const std::string &path) {
  std::ifstream in(path);
  return nlohmann::json::parse(in);
}

}  // namespace

TEST(OperationHistory, PendingOperationsNotExported) {
  OperationHistory history(7);
  history.SetSyncTime(1000);
  size_t put = history.RecordOperation(OpInput::Put("1", "1"));
  size_t get = history.RecordOperation(OpInput::Get("1"));
  history.RecordOperation(OpInput::Delete("2"));
  EXPECT_EQ(put, 0UL);
  EXPECT_EQ(get, 1UL);

  history.CompleteOperation(get, OpOutput{"ok", std::string("1")});
  history.CompleteOperation(put, OpOutput{"ok", {}});

  EXPECT_EQ(history.OperationCount(), 3UL);
  EXPECT_EQ(history.CompletedCount(), 2UL);

  std::string path = TempPath("pending.json");
  ASSERT_TRUE(history.ExportJSON(path));
  nlohmann::json j = ReadJSON(path);
  std::remove(path.c_str());

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2UL);
  // Recorded order, not completion order.
  EXPECT_EQ(j[0]["input"]["type"], "Put");
  EXPECT_EQ(j[1]["input"]["type"], "Get");
}

TEST(OperationHistory, JSONShape) {
  OperationHistory history(3);
  history.SetSyncTime(5000);
  size_t put = history.RecordOperation(OpInput::Put("k", "v"));
  size_t get = history.RecordOperation(OpInput::Get("k"));
  size_t del = history.RecordOperation(OpInput::Delete("k"));
  history.CompleteOperation(put, OpOutput{"ok", {}});
  history.CompleteOperation(get, OpOutput{"ok", std::string("v")});
  history.CompleteOperation(del, OpOutput{"ok", {}});

  nlohmann::json j = history.ToJSON();
  ASSERT_EQ(j.size(), 3UL);

  EXPECT_EQ(j[0]["client_id"], 3);
  EXPECT_EQ(j[0]["input"]["type"], "Put");
  EXPECT_EQ(j[0]["input"]["key"], "k");
  EXPECT_EQ(j[0]["input"]["value"], "v");
  EXPECT_EQ(j[0]["output"]["status"], "ok");
  EXPECT_FALSE(j[0]["output"].contains("value"));

  EXPECT_EQ(j[1]["input"]["type"], "Get");
  EXPECT_FALSE(j[1]["input"].contains("value"));
  EXPECT_EQ(j[1]["output"]["value"], "v");

  EXPECT_EQ(j[2]["input"]["type"], "Delete");
  EXPECT_EQ(j[2]["input"]["key"], "k");

  for (const auto &op : j) {
    EXPECT_TRUE(op.contains("call"));
    EXPECT_TRUE(op.contains("return_time"));
    EXPECT_LE(op["call"].get<int64_t>(), op["return_time"].get<int64_t>());
  }
}

TEST(OperationHistory, TimestampsAnchoredOnSyncTime) {
  OperationHistory history(1);
  const int64_t syncMs = 1700000000000LL;
  history.SetSyncTime(syncMs);
  size_t op = history.RecordOperation(OpInput::Get("a"));
  usleep(2000);
  history.CompleteOperation(op, OpOutput{"ok", {}});

  nlohmann::json j = history.ToJSON();
  ASSERT_EQ(j.size(), 1UL);
  int64_t call = j[0]["call"].get<int64_t>();
  int64_t ret = j[0]["return_time"].get<int64_t>();
  const int64_t origin = syncMs * 1000000LL;
  EXPECT_GE(call, origin);
  EXPECT_LT(call - origin, 1000000000LL);
  EXPECT_GE(ret - call, 2000000LL);
}

TEST(OperationHistory, LastCompletionWins) {
  OperationHistory history(1);
  size_t op = history.RecordOperation(OpInput::Get("a"));
  history.CompleteOperation(op, OpOutput{"ok", std::string("first")});
  nlohmann::json first = history.ToJSON();
  usleep(1000);
  history.CompleteOperation(op, OpOutput{"ok", std::string("second")});
  nlohmann::json second = history.ToJSON();

  EXPECT_EQ(history.CompletedCount(), 1UL);
  ASSERT_EQ(second.size(), 1UL);
  EXPECT_EQ(second[0]["output"]["value"], "second");
  EXPECT_GT(second[0]["return_time"].get<int64_t>(),
            first[0]["return_time"].get<int64_t>());
}

TEST(OperationHistory, UnknownIndexIgnored) {
  OperationHistory history(1);
  history.RecordOperation(OpInput::Get("a"));
  history.CompleteOperation(1, OpOutput{"ok", {}});
  history.CompleteOperation(100, OpOutput{"ok", {}});
  EXPECT_EQ(history.OperationCount(), 1UL);
  EXPECT_EQ(history.CompletedCount(), 0UL);
  EXPECT_TRUE(history.ToJSON().empty());
}

TEST(OperationHistory, EmptyHistoryExportsEmptyArray) {
  OperationHistory history(1);
  std::string path = TempPath("empty.json");
  ASSERT_TRUE(history.ExportJSON(path));
  nlohmann::json j = ReadJSON(path);
  std::remove(path.c_str());
  EXPECT_TRUE(j.is_array());
  EXPECT_TRUE(j.empty());
}

TEST(OperationHistory, UnwritablePath) {
  OperationHistory history(1);
  size_t op = history.RecordOperation(OpInput::Put("a", "a"));
  history.CompleteOperation(op, OpOutput{"ok", {}});
  EXPECT_FALSE(history.ExportJSON("/nonexistent-dir/history.json"));
}

TEST(OperationHistory, UsableThroughInterface) {
  std::unique_ptr<HistoryRecorder> recorder(new OperationHistory(9));
  recorder->SetSyncTime(42);
  size_t op = recorder->RecordOperation(OpInput::Put("x", "y"));
  recorder->CompleteOperation(op, OpOutput{"ok", {}});
  EXPECT_EQ(recorder->OperationCount(), 1UL);
  EXPECT_EQ(recorder->CompletedCount(), 1UL);
}

}  // namespace correctness
