// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/client_data.cc
 *   Per-request send and receive times of a benchmark client
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

#include "kvbench/client_data.h"

#include <fstream>

#include "lib/assert.h"
#include "lib/message.h"
#include "lib/timeval.h"

namespace kvbench {

ClientData::ClientData() : responseCount(0) {}

CommandId ClientData::NewRequest(bool isWrite) {
  CommandId id = requests.size();
  requests.push_back(RequestRecord{timeval_now_ms(), isWrite, {}});
  return id;
}

void ClientData::NewResponse(CommandId id) {
  UW_ASSERT(id < requests.size());
  RequestRecord &record = requests[id];
  if (record.receiveTime) {
    Warning("Ignoring duplicate response for command %lu", id);
    return;
  }
  // Wall clock steps must not produce a receive time before the send time.
  int64_t now = timeval_now_ms();
  record.receiveTime = now < record.sendTime ? record.sendTime : now;
  ++responseCount;
}

bool ClientData::WriteCSV(const std::string &path) const {
  std::ofstream out(path);
  if (!out) {
    Warning("Unable to open %s for writing", path.c_str());
    return false;
  }
  out << "send_time,is_write,receive_time\n";
  for (const auto &record : requests) {
    out << record.sendTime << ',' << (record.isWrite ? "true" : "false")
        << ',';
    if (record.receiveTime) {
      out << *record.receiveTime;
    }
    out << '\n';
  }
  out.flush();
  if (!out) {
    Warning("Failed to write %s", path.c_str());
    return false;
  }
  return true;
}

std::vector<uint64_t> ClientData::Latencies() const {
  std::vector<uint64_t> latencies;
  latencies.reserve(responseCount);
  for (const auto &record : requests) {
    if (record.receiveTime) {
      latencies.push_back(*record.receiveTime - record.sendTime);
    }
  }
  return latencies;
}

}  // namespace kvbench
