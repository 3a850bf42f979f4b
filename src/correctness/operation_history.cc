// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * correctness/operation_history.cc
 *   In-memory operation history with call and return timestamps
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

#include "correctness/operation_history.h"

#include <time.h>

#include <fstream>
#include <utility>

#include "lib/message.h"

namespace correctness {

namespace {

uint64_t MonotonicNs() {
  struct timespec ts {};
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return ts.tv_sec * 1000000000ULL + ts.tv_nsec;
}

int64_t RealtimeNs() {
  struct timespec ts {};
  clock_gettime(CLOCK_REALTIME, &ts);
  return ts.tv_sec * 1000000000LL + ts.tv_nsec;
}

}  // namespace

const char *OpTypeName(OpType type) {
  switch (type) {
    case OpType::PUT:
      return "Put";
    case OpType::GET:
      return "Get";
    case OpType::DELETE:
      return "Delete";
  }
  NOT_REACHABLE();
}

OpInput OpInput::Put(std::string key, std::string value) {
  return OpInput{OpType::PUT, std::move(key), std::move(value)};
}

OpInput OpInput::Get(std::string key) {
  return OpInput{OpType::GET, std::move(key), ""};
}

OpInput OpInput::Delete(std::string key) {
  return OpInput{OpType::DELETE, std::move(key), ""};
}

OperationHistory::OperationHistory(uint64_t clientId)
    : clientId(clientId),
      syncTimeNs(RealtimeNs()),
      originMonoNs(MonotonicNs()) {}

void OperationHistory::SetSyncTime(int64_t syncTimeMs) {
  syncTimeNs = syncTimeMs * 1000000LL;
  originMonoNs = MonotonicNs();
  Debug("History origin set to %ld ms", syncTimeMs);
}

int64_t OperationHistory::Now() const {
  return syncTimeNs + static_cast<int64_t>(MonotonicNs() - originMonoNs);
}

size_t OperationHistory::RecordOperation(const OpInput &input) {
  size_t opIndex = operations.size();
  operations.push_back(Operation{input, Now(), OpOutput{"pending", {}}, 0});
  return opIndex;
}

void OperationHistory::CompleteOperation(size_t opIndex,
                                         const OpOutput &output) {
  if (opIndex >= operations.size()) {
    Debug("Ignoring completion of unknown operation %lu", opIndex);
    return;
  }
  Operation &op = operations[opIndex];
  op.output = output;
  op.returnTime = Now();
}

size_t OperationHistory::CompletedCount() const {
  size_t n = 0;
  for (const auto &op : operations) {
    if (op.returnTime > 0) {
      ++n;
    }
  }
  return n;
}

nlohmann::json OperationHistory::ToJSON() const {
  nlohmann::json history = nlohmann::json::array();
  for (const auto &op : operations) {
    if (op.returnTime <= 0) {
      continue;
    }

    nlohmann::json input = {{"type", OpTypeName(op.input.type)},
                            {"key", op.input.key}};
    if (op.input.type == OpType::PUT) {
      input["value"] = op.input.value;
    }

    nlohmann::json output = {{"status", op.output.status}};
    if (op.output.value) {
      output["value"] = *op.output.value;
    }

    history.push_back({{"client_id", clientId},
                       {"input", std::move(input)},
                       {"call", op.call},
                       {"output", std::move(output)},
                       {"return_time", op.returnTime}});
  }
  return history;
}

bool OperationHistory::ExportJSON(const std::string &path) const {
  std::ofstream out(path);
  if (!out) {
    Warning("Unable to open history file %s", path.c_str());
    return false;
  }
  out << ToJSON().dump(2) << std::endl;
  if (!out) {
    Warning("Failed to write history file %s", path.c_str());
    return false;
  }
  Notice("Wrote %lu of %lu operations to %s", CompletedCount(),
         operations.size(), path.c_str());
  return true;
}

}  // namespace correctness
