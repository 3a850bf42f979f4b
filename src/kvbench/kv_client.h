// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/kv_client.h
 *   Benchmark client that drives a phased read/write workload
 *   against a key-value server
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

#ifndef KVBENCH_KV_CLIENT_H_
#define KVBENCH_KV_CLIENT_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "clock/clocksim.h"
#include "correctness/history_recorder.h"
#include "kvbench/client_config.h"
#include "kvbench/client_data.h"
#include "kvbench/kvbench-proto.pb.h"
#include "lib/configuration.h"
#include "lib/transport.h"

namespace kvbench {

// Invoked once when the run is over. The argument is false if the summary
// or the request CSV could not be written.
using kv_done_callback = std::function<void(bool)>;

/*
 * The client runs entirely on the transport's event loop:
 *
 *   AWAITING_START  sent ClientHello, waiting for the server's StartSignal
 *                   and then for the scheduled start instant
 *   ACTIVE          issuing requests according to the current phase
 *   DRAINING        all phases done; waiting for the outstanding responses
 *   FINISHED        transport stopped and results written
 *
 * The number of requests issued when the last phase ends is the number of
 * responses the client waits for, so a run never ends with requests in
 * flight.
 */
class KVClient : public TransportReceiver {
 public:
  enum State { AWAITING_START, ACTIVE, DRAINING, FINISHED };

  // history may be null, in which case no operation history is kept.
  KVClient(const transport::Configuration &config, Transport *transport,
           ClientConfig clientConfig, ClockSim *clock,
           std::unique_ptr<correctness::HistoryRecorder> history);
  ~KVClient() override;

  void Start(kv_done_callback cb);

  void ReceiveMessage(const TransportAddress &remote, std::string *type,
                      std::string *data) override;

  inline State GetState() const { return state; }
  inline const ClientData &GetClientData() const { return data; }
  inline const ClientConfig &GetConfig() const { return clientConfig; }
  inline const correctness::HistoryRecorder *GetHistory() const {
    return history.get();
  }

 private:
  void HandleStartSignal(const proto::StartSignal &msg);
  void HandleReadResponse(const proto::ReadResponse &msg);
  void HandleWriteResponse(const proto::WriteResponse &msg);
  void HandleResponse(CommandId id, const correctness::OpOutput &output);

  void BeginRun();
  void StartPhase();
  void PhaseDone();
  void SendNext();
  void SendRequest(bool isWrite);

  void CheckFinished();
  void Finish();
  bool SaveResults();
  void LogLatencies() const;

  const transport::Configuration &config;
  Transport *transport;
  ClientConfig clientConfig;
  ClockSim *clock;
  std::unique_ptr<correctness::HistoryRecorder> history;

  State state;
  bool startReceived;
  int64_t startTimeMs;
  size_t phaseIdx;
  size_t phaseRequests;
  int requestTimer;
  int phaseTimer;
  int startTimer;
  std::optional<size_t> targetResponses;
  uint64_t clockStartUs;

  ClientData data;
  std::unordered_map<CommandId, size_t> opIndices;

  std::mt19937 rand;
  std::uniform_real_distribution<double> ratioDist;
  kv_done_callback done;
};

}  // namespace kvbench

#endif  // KVBENCH_KV_CLIENT_H_
