// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * transport.h:
 *   message-passing network interface definition
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

#ifndef LIB_TRANSPORT_H_
#define LIB_TRANSPORT_H_

#include <google/protobuf/message.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "lib/configuration.h"

using Message = ::google::protobuf::Message;

class TransportAddress {
 public:
  virtual ~TransportAddress() = default;
  virtual TransportAddress *clone() const = 0;
};

class TransportReceiver {
 public:
  virtual ~TransportReceiver();
  virtual void SetAddress(const TransportAddress *addr);
  virtual const TransportAddress *GetAddress();

  virtual void ReceiveMessage(const TransportAddress &remote,
                              std::string *type, std::string *data) = 0;

 protected:
  const TransportAddress *myAddress{nullptr};
};

using timer_callback_t = std::function<void()>;

class Transport {
 public:
  virtual ~Transport() = default;

  // Registers a receiver. Clients pass replicaIdx == -1 and are only able to
  // send to (and receive replies from) the replicas in the configuration.
  virtual void Register(TransportReceiver *receiver,
                        const transport::Configuration &config, int groupIdx,
                        int replicaIdx) = 0;

  virtual bool SendMessage(TransportReceiver *src, const TransportAddress &dst,
                           const Message &m) = 0;
  virtual bool SendMessageToReplica(TransportReceiver *src, int groupIdx,
                                    int replicaIdx, const Message &m) = 0;

  virtual void Run() = 0;
  // Breaks out of Run(). No callbacks (message or timer) are invoked for
  // this transport after Stop() returns.
  virtual void Stop() = 0;

  virtual int Timer(uint64_t ms, timer_callback_t cb) = 0;
  virtual int TimerMicro(uint64_t us, timer_callback_t cb) = 0;
  virtual bool CancelTimer(int id) = 0;
  virtual void CancelAllTimers() = 0;
};

#endif  // LIB_TRANSPORT_H_
