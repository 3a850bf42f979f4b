// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * tcptransport.h:
 *   message-passing network interface that uses TCP message delivery
 *   and libevent
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

#ifndef LIB_TCPTRANSPORT_H_
#define LIB_TCPTRANSPORT_H_

#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/util.h>
#include <netinet/in.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lib/configuration.h"
#include "lib/transport.h"
#include "lib/transportcommon.h"

class TCPTransportAddress : public TransportAddress {
 public:
  TCPTransportAddress *clone() const override;
  ~TCPTransportAddress() override = default;
  sockaddr_in addr;

 private:
  explicit TCPTransportAddress(const sockaddr_in &addr);

  friend class TCPTransport;
  friend bool operator==(const TCPTransportAddress &a,
                         const TCPTransportAddress &b);
  friend bool operator!=(const TCPTransportAddress &a,
                         const TCPTransportAddress &b);
  friend bool operator<(const TCPTransportAddress &a,
                        const TCPTransportAddress &b);
};

// Client-side TCP transport. Every (destination, receiver) pair gets its own
// connection, opened lazily on the first send. Incoming messages are
// dispatched at a higher libevent priority than timers, so a reply that is
// ready is always handled before a timer that expires in the same loop
// iteration.
class TCPTransport : public TransportCommon<TCPTransportAddress> {
 public:
  explicit TCPTransport(bool handleSignals = true);
  ~TCPTransport() override;

  void Register(TransportReceiver *receiver,
                const transport::Configuration &config, int groupIdx,
                int replicaIdx) override;

  void Run() override;
  void Stop() override;
  int Timer(uint64_t ms, timer_callback_t cb) override;
  int TimerMicro(uint64_t us, timer_callback_t cb) override;
  bool CancelTimer(int id) override;
  void CancelAllTimers() override;

 private:
  static const int kMessagePriority = 0;
  static const int kTimerPriority = 1;

  struct TCPTransportTimerInfo {
    explicit TCPTransportTimerInfo(timer_callback_t &&cb) : cb(std::move(cb)) {}
    timer_callback_t cb{};
    TCPTransport *transport{};
    event *ev{};
    int id{};
  };
  struct TCPTransportConnection {
    TCPTransport *transport;
    TransportReceiver *receiver;
    TCPTransportAddress remote;
    int fd;
  };

  event_base *libeventBase;
  std::vector<event *> signalEvents;
  int lastTimerId;
  std::unordered_map<int, TCPTransportTimerInfo *> timers;
  std::map<std::pair<TCPTransportAddress, TransportReceiver *>,
           struct bufferevent *>
      tcpOutgoing;
  std::map<struct bufferevent *, TCPTransportConnection *> tcpConnections;
  bool stopped;

  bool SendMessageInternal(TransportReceiver *src,
                           const TCPTransportAddress &dst,
                           const Message &m) override;
  TCPTransportAddress LookupAddress(const transport::Configuration &config,
                                    int groupIdx, int replicaIdx) override;
  TCPTransportAddress LookupAddress(const transport::ReplicaAddress &addr);

  struct bufferevent *ConnectTCP(const TCPTransportAddress &dst,
                                 TransportReceiver *src);
  void CloseConnection(struct bufferevent *bev);
  int TimerInternal(struct timeval *tv, timer_callback_t cb);
  void OnTimer(TCPTransportTimerInfo *info);
  static void TimerCallback(evutil_socket_t fd, int16_t what, void *arg);
  static void LogCallback(int severity, const char *msg);
  static void FatalCallback(int err);
  static void SignalCallback(evutil_socket_t fd, int16_t what, void *arg);
  static void TCPReadableCallback(struct bufferevent *bev, void *arg);
  static void TCPOutgoingEventCallback(struct bufferevent *bev, int16_t what,
                                       void *arg);
};

#endif  // LIB_TCPTRANSPORT_H_
