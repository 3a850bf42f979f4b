// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * correctness/history_recorder.h
 *   Interface for recording client operations for offline
 *   linearizability checking
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

#ifndef CORRECTNESS_HISTORY_RECORDER_H_
#define CORRECTNESS_HISTORY_RECORDER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace correctness {

enum class OpType { PUT, GET, DELETE };

const char *OpTypeName(OpType type);

struct OpInput {
  OpType type;
  std::string key;
  std::string value;  // only meaningful for PUT

  static OpInput Put(std::string key, std::string value);
  static OpInput Get(std::string key);
  static OpInput Delete(std::string key);
};

struct OpOutput {
  std::string status;
  std::optional<std::string> value;
};

class HistoryRecorder {
 public:
  virtual ~HistoryRecorder() = default;

  // Anchors call and return timestamps on an absolute instant (UTC ms).
  virtual void SetSyncTime(int64_t syncTimeMs) = 0;

  // Returns an index to pass to CompleteOperation().
  virtual size_t RecordOperation(const OpInput &input) = 0;
  virtual void CompleteOperation(size_t opIndex, const OpOutput &output) = 0;

  // Returns false if the history could not be written.
  virtual bool ExportJSON(const std::string &path) const = 0;

  virtual size_t OperationCount() const = 0;
  virtual size_t CompletedCount() const = 0;
};

}  // namespace correctness

#endif  // CORRECTNESS_HISTORY_RECORDER_H_
