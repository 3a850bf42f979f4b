// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * configuration.h:
 *   Representation of a replica group configuration, i.e. the number
 *   and list of replicas in the group
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

#ifndef LIB_CONFIGURATION_H_
#define LIB_CONFIGURATION_H_

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace transport {

struct ReplicaAddress {
  ReplicaAddress(std::string host, std::string port);
  bool operator==(const ReplicaAddress &other) const;
  inline bool operator!=(const ReplicaAddress &other) const {
    return !(*this == other);
  }
  bool operator<(const ReplicaAddress &other) const;

  std::string host;
  std::string port;
};

class Configuration {
 public:
  Configuration(int g, int n, int f,
                std::map<int, std::vector<ReplicaAddress>> g_replicas);
  explicit Configuration(std::istream &file);
  virtual ~Configuration();

  const ReplicaAddress &replica(int group, int idx) const;
  bool operator==(const Configuration &other) const;
  inline bool operator!=(const Configuration &other) const {
    return !(*this == other);
  }

  int g;  // number of groups
  int n;  // number of replicas per group
  int f;  // number of failures tolerated (assume homogeneous across groups)

 private:
  std::map<int, std::vector<ReplicaAddress>> g_replicas;
};

}  // namespace transport

#endif  // LIB_CONFIGURATION_H_
