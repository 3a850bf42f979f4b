// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * correctness/operation_history.h
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

#ifndef CORRECTNESS_OPERATION_HISTORY_H_
#define CORRECTNESS_OPERATION_HISTORY_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "correctness/history_recorder.h"

namespace correctness {

/*
 * Timestamps are nanoseconds since the epoch, computed as the sync origin
 * plus monotonic time elapsed since the origin was set. All clients that
 * receive the same start signal therefore share a time base, and wall clock
 * steps during the run do not reorder a client's own operations.
 *
 * An operation stays pending (return_time == 0) until it is completed.
 * Pending operations are left out of the exported history.
 */
class OperationHistory : public HistoryRecorder {
 public:
  explicit OperationHistory(uint64_t clientId);
  ~OperationHistory() override = default;

  void SetSyncTime(int64_t syncTimeMs) override;
  size_t RecordOperation(const OpInput &input) override;
  // Out of range indices are ignored. Completing an operation twice keeps
  // the later output and return time.
  void CompleteOperation(size_t opIndex, const OpOutput &output) override;
  bool ExportJSON(const std::string &path) const override;

  inline size_t OperationCount() const override { return operations.size(); }
  size_t CompletedCount() const override;

  // The exported document, without writing it anywhere.
  nlohmann::json ToJSON() const;

 private:
  struct Operation {
    OpInput input;
    int64_t call;
    OpOutput output;
    int64_t returnTime;
  };

  int64_t Now() const;

  const uint64_t clientId;
  int64_t syncTimeNs;
  uint64_t originMonoNs;
  std::vector<Operation> operations;
};

}  // namespace correctness

#endif  // CORRECTNESS_OPERATION_HISTORY_H_
