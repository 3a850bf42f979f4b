// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/kv_client.cc
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

#include "kvbench/kv_client.h"

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "lib/assert.h"
#include "lib/message.h"
#include "lib/timeval.h"

namespace kvbench {

namespace {

const char *StateName(KVClient::State state) {
  switch (state) {
    case KVClient::AWAITING_START:
      return "AWAITING_START";
    case KVClient::ACTIVE:
      return "ACTIVE";
    case KVClient::DRAINING:
      return "DRAINING";
    case KVClient::FINISHED:
      return "FINISHED";
  }
  NOT_REACHABLE();
}

}  // namespace

KVClient::KVClient(const transport::Configuration &config,
                   Transport *transport, ClientConfig clientConfig,
                   ClockSim *clock,
                   std::unique_ptr<correctness::HistoryRecorder> history)
    : config(config),
      transport(transport),
      clientConfig(std::move(clientConfig)),
      clock(clock),
      history(std::move(history)),
      state(AWAITING_START),
      startReceived(false),
      startTimeMs(0),
      phaseIdx(0),
      phaseRequests(0),
      requestTimer(-1),
      phaseTimer(-1),
      startTimer(-1),
      clockStartUs(0),
      rand(this->clientConfig.client_id),
      ratioDist(0.0, 1.0) {
  UW_ASSERT(clock != nullptr);
  transport->Register(this, config, -1, -1);
}

KVClient::~KVClient() = default;

void KVClient::Start(kv_done_callback cb) {
  done = std::move(cb);

  const transport::ReplicaAddress &server =
      config.replica(0, clientConfig.server_id);
  clientConfig.server_address = server.host + ":" + server.port;

  proto::ClientHello hello;
  hello.set_client_id(clientConfig.client_id);
  Notice("Client %lu waiting for start signal from server %d at %s",
         clientConfig.client_id, clientConfig.server_id,
         clientConfig.server_address.c_str());
  if (!transport->SendMessageToReplica(this, 0, clientConfig.server_id,
                                       hello)) {
    Warning("Failed to send hello to server %d", clientConfig.server_id);
  }
}

void KVClient::ReceiveMessage(const TransportAddress &remote,
                              std::string *type, std::string *data) {
  proto::StartSignal startSignal;
  proto::ReadResponse readResponse;
  proto::WriteResponse writeResponse;

  if (state == FINISHED) {
    Debug("Dropping %s received after the run finished", type->c_str());
    return;
  }

  if (!startReceived && *type != startSignal.GetTypeName()) {
    Panic("Expected start signal, received %s", type->c_str());
  }

  if (*type == startSignal.GetTypeName()) {
    startSignal.ParseFromString(*data);
    HandleStartSignal(startSignal);
  } else if (*type == readResponse.GetTypeName()) {
    readResponse.ParseFromString(*data);
    HandleReadResponse(readResponse);
  } else if (*type == writeResponse.GetTypeName()) {
    writeResponse.ParseFromString(*data);
    HandleWriteResponse(writeResponse);
  } else {
    Panic("Received unexpected message type: %s", type->c_str());
  }
}

void KVClient::HandleStartSignal(const proto::StartSignal &msg) {
  if (startReceived) {
    Debug("Ignoring repeated start signal");
    return;
  }
  startReceived = true;
  startTimeMs = msg.start_time_ms();

  int64_t untilStart = startTimeMs - timeval_now_ms();
  clientConfig.sync_time_ms = untilStart;
  if (untilStart > 0) {
    Debug("Waiting %ld ms for the scheduled start", untilStart);
    startTimer = transport->Timer(untilStart, [this]() {
      startTimer = -1;
      BeginRun();
    });
  } else {
    Warning("Started %ld ms after synchronization point", -untilStart);
    BeginRun();
  }
}

void KVClient::BeginRun() {
  if (history) {
    history->SetSyncTime(startTimeMs);
  }
  clockStartUs = clock->GetTime();
  Notice("Client %lu starting at simulated time %lu us (+/- %.0f us)",
         clientConfig.client_id, clockStartUs, clock->GetUncertainty());

  state = ACTIVE;
  phaseIdx = 0;
  if (clientConfig.phases.empty()) {
    Notice("No phases configured");
    targetResponses = 0;
    state = DRAINING;
    CheckFinished();
    return;
  }
  StartPhase();
}

void KVClient::StartPhase() {
  const Phase &phase = clientConfig.phases[phaseIdx];
  Debug("Starting phase %lu: %lu ms, read ratio %.2f, delay %lu us", phaseIdx,
        phase.duration_ms, phase.read_ratio, phase.request_delay_us);
  phaseRequests = 0;
  // The first request goes out immediately.
  requestTimer = transport->TimerMicro(0, [this]() { SendNext(); });
  phaseTimer = transport->Timer(phase.duration_ms, [this]() {
    phaseTimer = -1;
    PhaseDone();
  });
}

void KVClient::PhaseDone() {
  if (requestTimer != -1) {
    transport->CancelTimer(requestTimer);
    requestTimer = -1;
  }
  Notice("Completed phase %lu with %lu requests", phaseIdx, phaseRequests);

  ++phaseIdx;
  if (phaseIdx < clientConfig.phases.size()) {
    StartPhase();
    return;
  }

  targetResponses = data.RequestCount();
  state = DRAINING;
  Notice("All phases done; waiting for %lu of %lu responses",
         *targetResponses - std::min(*targetResponses, data.ResponseCount()),
         *targetResponses);
  CheckFinished();
}

void KVClient::SendNext() {
  requestTimer = -1;
  if (state != ACTIVE) {
    return;
  }
  const Phase &phase = clientConfig.phases[phaseIdx];
  SendRequest(ratioDist(rand) > phase.read_ratio);
  requestTimer =
      transport->TimerMicro(phase.request_delay_us, [this]() { SendNext(); });
}

void KVClient::SendRequest(bool isWrite) {
  CommandId id = data.RequestCount();
  std::string key = std::to_string(id);

  proto::Append append;
  append.set_client_id(clientConfig.client_id);
  append.set_command_id(id);
  proto::KVCommand *cmd = append.mutable_command();
  cmd->set_key(key);
  if (isWrite) {
    cmd->set_op(proto::KVCommand::PUT);
    cmd->set_value(key);
  } else {
    cmd->set_op(proto::KVCommand::GET);
  }

  if (history) {
    correctness::OpInput input = isWrite
                                     ? correctness::OpInput::Put(key, key)
                                     : correctness::OpInput::Get(key);
    opIndices[id] = history->RecordOperation(input);
  }

  Debug("Sending %s %lu", isWrite ? "PUT" : "GET", id);
  if (!transport->SendMessageToReplica(this, 0, clientConfig.server_id,
                                       append)) {
    Warning("Failed to send command %lu to server %d", id,
            clientConfig.server_id);
  }
  UW_ASSERT_EQ(data.NewRequest(isWrite), id);
  ++phaseRequests;
}

void KVClient::HandleReadResponse(const proto::ReadResponse &msg) {
  correctness::OpOutput output{"ok", {}};
  if (msg.has_value()) {
    output.value = msg.value();
  }
  HandleResponse(msg.command_id(), output);
}

void KVClient::HandleWriteResponse(const proto::WriteResponse &msg) {
  HandleResponse(msg.command_id(), correctness::OpOutput{"ok", {}});
}

void KVClient::HandleResponse(CommandId id,
                              const correctness::OpOutput &output) {
  Debug("Received response for %lu", id);
  data.NewResponse(id);

  if (history) {
    auto itr = opIndices.find(id);
    if (itr != opIndices.end()) {
      history->CompleteOperation(itr->second, output);
      opIndices.erase(itr);
    }
  }

  CheckFinished();
}

void KVClient::CheckFinished() {
  if (targetResponses && data.ResponseCount() >= *targetResponses) {
    Finish();
  }
}

void KVClient::Finish() {
  Debug("Finishing from state %s", StateName(state));
  state = FINISHED;

  for (int *timer : {&requestTimer, &phaseTimer, &startTimer}) {
    if (*timer != -1) {
      transport->CancelTimer(*timer);
      *timer = -1;
    }
  }
  transport->Stop();

  uint64_t clockEndUs = clock->GetTime();
  Notice("Client %lu finished: collected %lu responses to %lu requests",
         clientConfig.client_id, data.ResponseCount(), data.RequestCount());
  Notice("Run took %lu us of simulated time (+/- %.0f us)",
         clockEndUs - clockStartUs, clock->GetUncertainty());

  bool ok = SaveResults();
  LogLatencies();
  if (done) {
    done(ok);
  }
}

bool KVClient::SaveResults() {
  nlohmann::json summary = clientConfig.ToJSON();
  summary["request_count"] = data.RequestCount();
  summary["response_count"] = data.ResponseCount();

  bool ok = true;
  std::ofstream summaryFile(clientConfig.summary_filepath);
  if (summaryFile) {
    summaryFile << summary.dump(2) << std::endl;
  }
  if (!summaryFile) {
    Warning("Failed to write summary to %s",
            clientConfig.summary_filepath.c_str());
    ok = false;
  }

  if (!data.WriteCSV(clientConfig.output_filepath)) {
    ok = false;
  }

  if (history) {
    if (history->ExportJSON(clientConfig.history_output_path)) {
      Notice("Exported operation history to %s",
             clientConfig.history_output_path.c_str());
    } else {
      Warning("Failed to export operation history to %s",
              clientConfig.history_output_path.c_str());
    }
  }
  return ok;
}

void KVClient::LogLatencies() const {
  std::vector<uint64_t> latencies = data.Latencies();
  if (latencies.empty()) {
    return;
  }
  std::sort(latencies.begin(), latencies.end());

  uint64_t sum = 0;
  for (auto latency : latencies) {
    sum += latency;
  }
  Notice("Median latency is %lu ms", latencies[latencies.size() / 2]);
  Notice("Average latency is %lu ms", sum / latencies.size());
  Notice("90th percentile latency is %lu ms",
         latencies[latencies.size() * 90 / 100]);
  Notice("95th percentile latency is %lu ms",
         latencies[latencies.size() * 95 / 100]);
  Notice("99th percentile latency is %lu ms",
         latencies[latencies.size() * 99 / 100]);
}

}  // namespace kvbench
