// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * simtransport.cc:
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

#include "lib/simtransport.h"

#include <cstdint>
#include <utility>

#include "lib/assert.h"
#include "lib/message.h"

SimulatedTransportAddress::SimulatedTransportAddress(int addr) : addr(addr) {}

int SimulatedTransportAddress::GetAddr() const { return addr; }

SimulatedTransportAddress *SimulatedTransportAddress::clone() const {
  return new SimulatedTransportAddress(addr);
}

bool SimulatedTransportAddress::operator==(
    const SimulatedTransportAddress &other) const {
  return addr == other.addr;
}

bool SimulatedTransportAddress::operator<(
    const SimulatedTransportAddress &other) const {
  return addr < other.addr;
}

SimulatedTransport::SimulatedTransport()
    : lastAddr(-1), lastTimerId(0), vtime(0), stopped(false) {}

SimulatedTransport::~SimulatedTransport() = default;

void SimulatedTransport::Register(TransportReceiver *receiver,
                                  const transport::Configuration &config,
                                  int groupIdx, int replicaIdx) {
  // Allocate an endpoint
  ++lastAddr;
  int addr = lastAddr;
  endpoints[addr] = receiver;
  addrs[receiver] = addr;

  // Tell the receiver its address
  receiver->SetAddress(new SimulatedTransportAddress(addr));

  RegisterConfiguration(receiver, config);

  if (replicaIdx != -1) {
    replicaAddrs[std::make_pair(groupIdx, replicaIdx)] = addr;
  }
}

bool SimulatedTransport::SendMessageInternal(
    TransportReceiver *src, const SimulatedTransportAddress &dstAddr,
    const Message &m) {
  auto srcItr = addrs.find(src);
  UW_ASSERT(srcItr != addrs.end());
  int dst = dstAddr.addr;

  auto dstItr = endpoints.find(dst);
  if (dstItr == endpoints.end()) {
    Warning("Dropping %s message to unknown endpoint %d",
            m.GetTypeName().c_str(), dst);
    return false;
  }

  std::string type = m.GetTypeName();
  uint64_t delay = 0;
  for (auto &kv : filters) {
    if (!kv.second(src, dstItr->second, type, &delay)) {
      Debug("Filter %d dropped %s message", kv.first, type.c_str());
      return true;
    }
  }

  std::string msg;
  m.SerializeToString(&msg);
  QueuedMessage q{dst, srcItr->second, type, msg};

  if (delay == 0) {
    queue.push_back(std::move(q));
  } else {
    delayed.insert(std::make_pair(vtime + delay * 1000, std::move(q)));
  }
  return true;
}

SimulatedTransportAddress SimulatedTransport::LookupAddress(
    const transport::Configuration &cfg, int groupIdx, int replicaIdx) {
  auto itr = replicaAddrs.find(std::make_pair(groupIdx, replicaIdx));
  if (itr == replicaAddrs.end()) {
    Panic("No replica %d in group %d registered with simulated transport",
          replicaIdx, groupIdx);
  }
  return SimulatedTransportAddress(itr->second);
}

void SimulatedTransport::Run() {
  stopped = false;
  do {
    // Process queue
    while (!stopped && !queue.empty()) {
      QueuedMessage q = std::move(queue.front());
      queue.pop_front();

      auto dstItr = endpoints.find(q.dst);
      UW_ASSERT(dstItr != endpoints.end());
      Debug("Delivering %s message to endpoint %d", q.type.c_str(), q.dst);
      dstItr->second->ReceiveMessage(SimulatedTransportAddress(q.src),
                                     &q.type, &q.msg);
    }
    if (stopped) {
      break;
    }

    // Advance to the next event
    if (delayed.empty() && timers.empty()) {
      break;
    }
    uint64_t next = UINT64_MAX;
    if (!delayed.empty()) {
      next = delayed.begin()->first;
    }
    if (!timers.empty() && timers.begin()->first < next) {
      next = timers.begin()->first;
    }
    UW_ASSERT(next >= vtime);
    vtime = next;

    // Delayed messages due now go ahead of any timer due now
    while (!delayed.empty() && delayed.begin()->first <= vtime) {
      queue.push_back(std::move(delayed.begin()->second));
      delayed.erase(delayed.begin());
    }
    if (!queue.empty()) {
      continue;
    }

    // Process timers
    auto iter = timers.begin();
    timer_callback_t cb = std::move(iter->second.cb);
    timers.erase(iter);
    cb();
  } while (!stopped);
}

void SimulatedTransport::Stop() {
  stopped = true;
  queue.clear();
  delayed.clear();
}

void SimulatedTransport::AddFilter(int id, filter_t filter) {
  filters.insert(std::make_pair(id, std::move(filter)));
}

void SimulatedTransport::RemoveFilter(int id) { filters.erase(id); }

int SimulatedTransport::Timer(uint64_t ms, timer_callback_t cb) {
  return TimerMicro(ms * 1000, std::move(cb));
}

int SimulatedTransport::TimerMicro(uint64_t us, timer_callback_t cb) {
  ++lastTimerId;
  PendingTimer t{vtime + us, lastTimerId, std::move(cb)};
  timers.insert(std::make_pair(t.when, std::move(t)));
  return lastTimerId;
}

bool SimulatedTransport::CancelTimer(int id) {
  for (auto iter = timers.begin(); iter != timers.end(); ++iter) {
    if (iter->second.id == id) {
      timers.erase(iter);
      return true;
    }
  }
  return false;
}

void SimulatedTransport::CancelAllTimers() { timers.clear(); }
