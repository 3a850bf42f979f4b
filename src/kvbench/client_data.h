// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/client_data.h
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

#ifndef KVBENCH_CLIENT_DATA_H_
#define KVBENCH_CLIENT_DATA_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kvbench {

using CommandId = uint64_t;

/*
 * Ledger of every request the client issued, indexed by command id. Ids are
 * handed out densely from 0 in issuance order, so the id is the position of
 * the request's record.
 */
class ClientData {
 public:
  ClientData();

  // Records a request sent now and returns its command id.
  CommandId NewRequest(bool isWrite);

  // Records the response to a previously issued request. The first response
  // for an id wins; later ones are logged and ignored.
  void NewResponse(CommandId id);

  inline size_t RequestCount() const { return requests.size(); }
  inline size_t ResponseCount() const { return responseCount; }

  // One row per request in issuance order. Returns false on I/O failure.
  bool WriteCSV(const std::string &path) const;

  // Receive minus send time (ms) of every answered request, unsorted.
  std::vector<uint64_t> Latencies() const;

 private:
  struct RequestRecord {
    int64_t sendTime;  // ms since the epoch
    bool isWrite;
    std::optional<int64_t> receiveTime;
  };

  std::vector<RequestRecord> requests;
  size_t responseCount;
};

}  // namespace kvbench

#endif  // KVBENCH_CLIENT_DATA_H_
