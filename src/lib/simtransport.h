// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * simtransport.h:
 *   simulated message-passing interface for testing use
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

#ifndef LIB_SIMTRANSPORT_H_
#define LIB_SIMTRANSPORT_H_

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>

#include "lib/configuration.h"
#include "lib/transport.h"
#include "lib/transportcommon.h"

class SimulatedTransportAddress : public TransportAddress {
 public:
  SimulatedTransportAddress *clone() const override;
  int GetAddr() const;
  bool operator==(const SimulatedTransportAddress &other) const;
  inline bool operator!=(const SimulatedTransportAddress &other) const {
    return !(*this == other);
  }
  bool operator<(const SimulatedTransportAddress &other) const;

 private:
  explicit SimulatedTransportAddress(int addr);
  int addr;
  friend class SimulatedTransport;
};

// Single-threaded transport with a virtual clock. Run() delivers every queued
// message before advancing time to the next timer, so messages always take
// priority over timers, including messages delayed by a filter that become
// due at the same instant as a timer. Run() returns when there is nothing
// left to do or when Stop() is called.
class SimulatedTransport : public TransportCommon<SimulatedTransportAddress> {
 public:
  // Returning false drops the message. The filter may set delay (in ms) to
  // deliver the message later instead of immediately.
  using filter_t = std::function<bool(TransportReceiver *src,
                                      TransportReceiver *dst,
                                      const std::string &type,
                                      uint64_t *delay)>;

  SimulatedTransport();
  ~SimulatedTransport() override;

  void Register(TransportReceiver *receiver,
                const transport::Configuration &config, int groupIdx,
                int replicaIdx) override;
  void Run() override;
  void Stop() override;
  int Timer(uint64_t ms, timer_callback_t cb) override;
  int TimerMicro(uint64_t us, timer_callback_t cb) override;
  bool CancelTimer(int id) override;
  void CancelAllTimers() override;

  void AddFilter(int id, filter_t filter);
  void RemoveFilter(int id);

  // Virtual time in microseconds since the transport was created.
  inline uint64_t GetVirtualTime() const { return vtime; }
  inline size_t GetPendingTimers() const { return timers.size(); }

 protected:
  bool SendMessageInternal(TransportReceiver *src,
                           const SimulatedTransportAddress &dst,
                           const Message &m) override;
  SimulatedTransportAddress LookupAddress(const transport::Configuration &cfg,
                                          int groupIdx,
                                          int replicaIdx) override;

 private:
  struct QueuedMessage {
    int dst;
    int src;
    std::string type;
    std::string msg;
  };
  struct PendingTimer {
    uint64_t when;
    int id;
    timer_callback_t cb;
  };

  std::deque<QueuedMessage> queue;
  // Messages held back by a filter, keyed by delivery time.
  std::multimap<uint64_t, QueuedMessage> delayed;
  std::map<int, TransportReceiver *> endpoints;
  std::map<TransportReceiver *, int> addrs;
  int lastAddr;
  std::map<std::pair<int, int>, int> replicaAddrs;  // (group, replica)
  std::multimap<int, filter_t> filters;
  std::multimap<uint64_t, PendingTimer> timers;
  int lastTimerId;
  uint64_t vtime;
  bool stopped;
};

#endif  // LIB_SIMTRANSPORT_H_
