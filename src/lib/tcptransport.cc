// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * tcptransport.cc:
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

#include "lib/tcptransport.h"

#include <arpa/inet.h>
#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/event.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <csignal>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "lib/assert.h"
#include "lib/configuration.h"
#include "lib/message.h"

namespace {

const uint32_t MAGIC = 0x06121983;
const size_t MAX_MESSAGE_SIZE = 1073741824;
const int SOCKET_BUF_SIZE = 1048576;

}  // namespace

TCPTransportAddress::TCPTransportAddress(const sockaddr_in &addr) : addr(addr) {
  memset(&this->addr.sin_zero, 0, sizeof(this->addr.sin_zero));
}

TCPTransportAddress *TCPTransportAddress::clone() const {
  return new TCPTransportAddress(*this);
}

bool operator==(const TCPTransportAddress &a, const TCPTransportAddress &b) {
  return (memcmp(&a.addr, &b.addr, sizeof(a.addr)) == 0);
}

bool operator!=(const TCPTransportAddress &a, const TCPTransportAddress &b) {
  return !(a == b);
}

bool operator<(const TCPTransportAddress &a, const TCPTransportAddress &b) {
  return (memcmp(&a.addr, &b.addr, sizeof(a.addr)) < 0);
}

TCPTransportAddress TCPTransport::LookupAddress(
    const transport::ReplicaAddress &addr) {
  int res;
  struct addrinfo hints {};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = 0;
  hints.ai_flags = 0;
  struct addrinfo *ai;
  if ((res = getaddrinfo(addr.host.c_str(), addr.port.c_str(), &hints, &ai)) !=
      0) {
    Panic("Failed to resolve %s:%s: %s", addr.host.c_str(), addr.port.c_str(),
          gai_strerror(res));
  }
  if (ai->ai_addr->sa_family != AF_INET) {
    Panic("getaddrinfo returned a non IPv4 address");
  }
  TCPTransportAddress out(*reinterpret_cast<sockaddr_in *>(ai->ai_addr));
  freeaddrinfo(ai);
  return out;
}

TCPTransportAddress TCPTransport::LookupAddress(
    const transport::Configuration &config, int groupIdx, int replicaIdx) {
  return LookupAddress(config.replica(groupIdx, replicaIdx));
}

TCPTransport::TCPTransport(bool handleSignals)
    : lastTimerId(0), stopped(false) {
  event_set_log_callback(LogCallback);
  event_set_fatal_callback(FatalCallback);

  libeventBase = event_base_new();
  if (libeventBase == nullptr) {
    Panic("Failed to create libevent base");
  }
  Notice("Using Libevent with backend method %s.",
         event_base_get_method(libeventBase));

  // Lower numbers run first among simultaneously active events.
  if (event_base_priority_init(libeventBase, kTimerPriority + 1) < 0) {
    Panic("Failed to initialize libevent priorities");
  }

  if (handleSignals) {
    signalEvents.push_back(
        evsignal_new(libeventBase, SIGTERM, SignalCallback, this));
    signalEvents.push_back(
        evsignal_new(libeventBase, SIGINT, SignalCallback, this));
    signalEvents.push_back(evsignal_new(
        libeventBase, SIGPIPE, [](evutil_socket_t fd, int16_t what, void *arg) {},
        this));

    for (event *x : signalEvents) {
      event_add(x, nullptr);
    }
  }
}

TCPTransport::~TCPTransport() {
  while (!tcpConnections.empty()) {
    CloseConnection(tcpConnections.begin()->first);
  }
  CancelAllTimers();
  for (event *x : signalEvents) {
    event_free(x);
  }
  event_base_free(libeventBase);
}

void TCPTransport::Register(TransportReceiver *receiver,
                            const transport::Configuration &config,
                            int groupIdx, int replicaIdx) {
  if (replicaIdx != -1) {
    Panic("TCPTransport only supports client endpoints (replica %d)",
          replicaIdx);
  }
  RegisterConfiguration(receiver, config);
}

struct bufferevent *TCPTransport::ConnectTCP(const TCPTransportAddress &dst,
                                             TransportReceiver *src) {
  Debug("Opening new TCP connection to %s:%d", inet_ntoa(dst.addr.sin_addr),
        htons(dst.addr.sin_port));

  int fd;
  if ((fd = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
    PPanic("Failed to create socket for outgoing TCP connection");
  }

  if (fcntl(fd, F_SETFL, O_NONBLOCK, 1) != 0) {
    PWarning("Failed to set O_NONBLOCK on outgoing TCP socket");
  }

  int n = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<char *>(&n),
                 sizeof(n)) < 0) {
    PWarning("Failed to set TCP_NODELAY on outgoing TCP socket");
  }

  n = SOCKET_BUF_SIZE;
  if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, reinterpret_cast<char *>(&n),
                 sizeof(n)) < 0) {
    PWarning("Failed to set SO_RCVBUF on socket");
  }

  if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, reinterpret_cast<char *>(&n),
                 sizeof(n)) < 0) {
    PWarning("Failed to set SO_SNDBUF on socket");
  }

  struct bufferevent *bev =
      bufferevent_socket_new(libeventBase, fd, BEV_OPT_CLOSE_ON_FREE);
  if (bev == nullptr) {
    Panic("Failed to create bufferevent");
  }
  bufferevent_priority_set(bev, kMessagePriority);

  auto *conn = new TCPTransportConnection{this, src, dst, fd};
  tcpOutgoing[std::make_pair(dst, src)] = bev;
  tcpConnections[bev] = conn;

  bufferevent_setcb(bev, TCPReadableCallback, nullptr,
                    TCPOutgoingEventCallback, conn);

  if (bufferevent_socket_connect(
          bev, reinterpret_cast<const struct sockaddr *>(&dst.addr),
          sizeof(dst.addr)) < 0) {
    Warning("Failed to connect to server via TCP");
    CloseConnection(bev);
    return nullptr;
  }

  if (bufferevent_enable(bev, EV_READ | EV_WRITE) < 0) {
    Panic("Failed to enable bufferevent");
  }

  // Tell the receiver its address
  struct sockaddr_in sin {};
  socklen_t sinsize = sizeof(sin);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&sin), &sinsize) < 0) {
    PPanic("Failed to get socket name");
  }
  if (src->GetAddress() == nullptr) {
    src->SetAddress(new TCPTransportAddress(sin));
  }

  return bev;
}

void TCPTransport::CloseConnection(struct bufferevent *bev) {
  auto itr = tcpConnections.find(bev);
  UW_ASSERT(itr != tcpConnections.end());
  TCPTransportConnection *conn = itr->second;
  tcpOutgoing.erase(std::make_pair(conn->remote, conn->receiver));
  tcpConnections.erase(itr);
  bufferevent_free(bev);
  delete conn;
}

bool TCPTransport::SendMessageInternal(TransportReceiver *src,
                                       const TCPTransportAddress &dst,
                                       const Message &m) {
  if (stopped) {
    Debug("Dropping %s message sent after transport stopped.",
          m.GetTypeName().c_str());
    return false;
  }

  Debug("Sending %s message over TCP to %s:%d", m.GetTypeName().c_str(),
        inet_ntoa(dst.addr.sin_addr), htons(dst.addr.sin_port));

  struct bufferevent *bev;
  auto kv = tcpOutgoing.find(std::make_pair(dst, src));
  if (kv == tcpOutgoing.end()) {
    bev = ConnectTCP(dst, src);
    if (bev == nullptr) {
      return false;
    }
  } else {
    bev = kv->second;
  }

  std::string data;
  if (!m.SerializeToString(&data)) {
    Warning("Failed to serialize %s message", m.GetTypeName().c_str());
    return false;
  }
  std::string type = m.GetTypeName();
  size_t typeLen = type.length();
  size_t dataLen = data.length();
  size_t totalLen = sizeof(uint32_t) + sizeof(totalLen) + sizeof(typeLen) +
                    typeLen + sizeof(dataLen) + dataLen;

  /* packet format:
   * MAGIC + total length + type length + type + data length + data
   */
  std::vector<char> buf(totalLen);
  char *ptr = buf.data();

  *(reinterpret_cast<uint32_t *>(ptr)) = MAGIC;
  ptr += sizeof(uint32_t);
  *(reinterpret_cast<size_t *>(ptr)) = totalLen;
  ptr += sizeof(size_t);

  *(reinterpret_cast<size_t *>(ptr)) = typeLen;
  ptr += sizeof(size_t);
  memcpy(ptr, type.c_str(), typeLen);
  ptr += typeLen;

  *(reinterpret_cast<size_t *>(ptr)) = dataLen;
  ptr += sizeof(size_t);
  memcpy(ptr, data.c_str(), dataLen);
  ptr += dataLen;
  UW_ASSERT(static_cast<size_t>(ptr - buf.data()) == totalLen);

  if (bufferevent_write(bev, buf.data(), totalLen) < 0) {
    Warning("Failed to write to TCP buffer");
    return false;
  }
  return true;
}

void TCPTransport::Run() {
  stopped = false;
  int ret = event_base_dispatch(libeventBase);
  Debug("event_base_dispatch returned %d.", ret);
}

void TCPTransport::Stop() {
  if (stopped) {
    return;
  }
  stopped = true;
  event_base_loopbreak(libeventBase);

  // Replies that arrive from here on are never delivered.
  while (!tcpConnections.empty()) {
    CloseConnection(tcpConnections.begin()->first);
  }
  CancelAllTimers();
}

int TCPTransport::Timer(uint64_t ms, timer_callback_t cb) {
  struct timeval tv {};
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;

  return TimerInternal(&tv, std::move(cb));
}

int TCPTransport::TimerMicro(uint64_t us, timer_callback_t cb) {
  struct timeval tv {};
  tv.tv_sec = us / 1000000UL;
  tv.tv_usec = us % 1000000UL;

  return TimerInternal(&tv, std::move(cb));
}

int TCPTransport::TimerInternal(struct timeval *tv, timer_callback_t cb) {
  auto *info = new TCPTransportTimerInfo(std::move(cb));

  ++lastTimerId;

  info->transport = this;
  info->id = lastTimerId;
  info->ev = event_new(libeventBase, -1, 0, TimerCallback, info);
  event_priority_set(info->ev, kTimerPriority);

  timers[info->id] = info;

  event_add(info->ev, tv);

  return info->id;
}

bool TCPTransport::CancelTimer(int id) {
  auto info_itr = timers.find(id);

  if (info_itr == timers.end()) {
    return false;
  }

  event_del(info_itr->second->ev);
  event_free(info_itr->second->ev);
  delete info_itr->second;
  timers.erase(info_itr);

  return true;
}

void TCPTransport::CancelAllTimers() {
  while (!timers.empty()) {
    CancelTimer(timers.begin()->first);
  }
}

void TCPTransport::OnTimer(TCPTransportTimerInfo *info) {
  timers.erase(info->id);
  event_del(info->ev);
  event_free(info->ev);

  info->cb();

  delete info;
}

void TCPTransport::TimerCallback(evutil_socket_t fd, int16_t what, void *arg) {
  auto *info = static_cast<TCPTransport::TCPTransportTimerInfo *>(arg);

  UW_ASSERT(what & EV_TIMEOUT);

  info->transport->OnTimer(info);
}

void TCPTransport::LogCallback(int severity, const char *msg) {
  Message_Type msgType;
  switch (severity) {
    case EVENT_LOG_DEBUG:
      msgType = MSG_DEBUG;
      break;
    case EVENT_LOG_MSG:
      msgType = MSG_NOTICE;
      break;
    case EVENT_LOG_WARN:
    case EVENT_LOG_ERR:
      msgType = MSG_WARNING;
      break;
    default:
      NOT_REACHABLE();
  }

  _Message(msgType, "libevent", 0, nullptr, "%s", msg);
}

void TCPTransport::FatalCallback(int err) {
  Panic("Fatal libevent error: %d", err);
}

void TCPTransport::SignalCallback(evutil_socket_t fd, int16_t what, void *arg) {
  Notice("Terminating on SIGTERM/SIGINT");
  auto *transport = static_cast<TCPTransport *>(arg);
  transport->Stop();
}

void TCPTransport::TCPReadableCallback(struct bufferevent *bev, void *arg) {
  auto *conn = static_cast<TCPTransportConnection *>(arg);
  TCPTransport *transport = conn->transport;
  struct evbuffer *evbuf = bufferevent_get_input(bev);

  while (!transport->stopped && evbuffer_get_length(evbuf) > 0) {
    const size_t headerLen = sizeof(uint32_t) + sizeof(size_t);
    unsigned char *header = evbuffer_pullup(evbuf, headerLen);
    if (header == nullptr) {
      Debug("Incomplete header at head of stream.");
      return;
    }
    if (*reinterpret_cast<uint32_t *>(header) != MAGIC) {
      Panic("Bad magic number on TCP stream");
    }

    size_t totalSize = *reinterpret_cast<size_t *>(header + sizeof(uint32_t));
    if (totalSize < headerLen + 2 * sizeof(size_t) ||
        totalSize > MAX_MESSAGE_SIZE) {
      Panic("Invalid message size %lu on TCP stream", totalSize);
    }

    size_t evbufLength = evbuffer_get_length(evbuf);
    if (evbufLength < totalSize) {
      Debug("Only received %lu bytes of %lu byte message.", evbufLength,
            totalSize);
      return;
    }

    std::vector<char> buf(totalSize);
    int copied = evbuffer_remove(evbuf, buf.data(), totalSize);
    UW_ASSERT(copied >= 0 && static_cast<size_t>(copied) == totalSize);

    const char *ptr = buf.data() + headerLen;
    const char *end = buf.data() + totalSize;

    size_t typeLen = *(reinterpret_cast<const size_t *>(ptr));
    ptr += sizeof(size_t);
    if (typeLen > static_cast<size_t>(end - ptr)) {
      Panic("Truncated message type on TCP stream");
    }
    std::string msgType(ptr, typeLen);
    ptr += typeLen;

    if (sizeof(size_t) > static_cast<size_t>(end - ptr)) {
      Panic("Truncated message length on TCP stream");
    }
    size_t msgLen = *(reinterpret_cast<const size_t *>(ptr));
    ptr += sizeof(size_t);
    if (msgLen != static_cast<size_t>(end - ptr)) {
      Panic("Message length mismatch on TCP stream");
    }
    std::string msg(ptr, msgLen);

    Debug("Received %lu bytes %s message from %s:%d", totalSize,
          msgType.c_str(), inet_ntoa(conn->remote.addr.sin_addr),
          htons(conn->remote.addr.sin_port));
    // The receiver may stop the transport, which frees this connection.
    TCPTransportAddress remote = conn->remote;
    conn->receiver->ReceiveMessage(remote, &msgType, &msg);
  }
}

void TCPTransport::TCPOutgoingEventCallback(struct bufferevent *bev,
                                            int16_t what, void *arg) {
  auto *conn = static_cast<TCPTransportConnection *>(arg);
  TCPTransport *transport = conn->transport;
  TCPTransportAddress addr = conn->remote;

  if ((what & BEV_EVENT_CONNECTED) != 0) {
    Debug("Established outgoing TCP connection to %s:%d.",
          inet_ntoa(addr.addr.sin_addr), htons(addr.addr.sin_port));
  } else if ((what & BEV_EVENT_ERROR) != 0) {
    Warning("Error on outgoing TCP connection to %s:%d: %s",
            inet_ntoa(addr.addr.sin_addr), htons(addr.addr.sin_port),
            evutil_socket_error_to_string(EVUTIL_SOCKET_ERROR()));
    transport->CloseConnection(bev);
  } else if ((what & BEV_EVENT_EOF) != 0) {
    Warning("EOF on outgoing TCP connection to %s:%d.",
            inet_ntoa(addr.addr.sin_addr), htons(addr.addr.sin_port));
    transport->CloseConnection(bev);
  }
}
