// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * transportcommon.h:
 *   template support for implementing transports
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

#ifndef LIB_TRANSPORTCOMMON_H_
#define LIB_TRANSPORTCOMMON_H_

#include <map>
#include <tuple>
#include <utility>

#include "lib/configuration.h"
#include "lib/message.h"
#include "lib/transport.h"

template <typename ADDR>
class TransportCommon : public Transport {
 public:
  TransportCommon() = default;
  ~TransportCommon() override = default;

  bool SendMessage(TransportReceiver *src, const TransportAddress &dst,
                   const Message &m) override {
    const auto *dstAddr = dynamic_cast<const ADDR *>(&dst);
    if (dstAddr == nullptr) {
      Panic("Destination address does not belong to this transport");
    }
    return SendMessageInternal(src, *dstAddr, m);
  }

  bool SendMessageToReplica(TransportReceiver *src, int groupIdx,
                            int replicaIdx, const Message &m) override {
    auto cfgItr = configurations.find(src);
    if (cfgItr == configurations.end()) {
      Panic("Receiver sending to replica %d was never registered",
            replicaIdx);
    }

    auto key = std::make_tuple(src, groupIdx, replicaIdx);
    auto addrItr = replicaAddresses.find(key);
    if (addrItr == replicaAddresses.end()) {
      addrItr = replicaAddresses
                    .emplace(key, LookupAddress(cfgItr->second, groupIdx,
                                                replicaIdx))
                    .first;
    }
    return SendMessageInternal(src, addrItr->second, m);
  }

 protected:
  virtual bool SendMessageInternal(TransportReceiver *src, const ADDR &dst,
                                   const Message &m) = 0;
  virtual ADDR LookupAddress(const transport::Configuration &cfg,
                             int groupIdx, int replicaIdx) = 0;

  void RegisterConfiguration(TransportReceiver *receiver,
                             const transport::Configuration &config) {
    configurations.erase(receiver);
    configurations.emplace(receiver, config);
    for (auto itr = replicaAddresses.begin();
         itr != replicaAddresses.end();) {
      if (std::get<0>(itr->first) == receiver) {
        itr = replicaAddresses.erase(itr);
      } else {
        ++itr;
      }
    }
  }

  std::map<TransportReceiver *, transport::Configuration> configurations;
  std::map<std::tuple<TransportReceiver *, int, int>, ADDR> replicaAddresses;
};

#endif  // LIB_TRANSPORTCOMMON_H_
