// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * configuration.cc:
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

#include "lib/configuration.h"

#include <sstream>
#include <string>
#include <tuple>
#include <utility>

#include "lib/message.h"

namespace transport {

ReplicaAddress::ReplicaAddress(std::string host, std::string port)
    : host(std::move(host)), port(std::move(port)) {}

bool ReplicaAddress::operator==(const ReplicaAddress &other) const {
  return ((host == other.host) && (port == other.port));
}

bool ReplicaAddress::operator<(const ReplicaAddress &other) const {
  return std::tie(host, port) < std::tie(other.host, other.port);
}

Configuration::Configuration(
    int g, int n, int f,
    std::map<int, std::vector<ReplicaAddress>> g_replicas)
    : g(g), n(n), f(f), g_replicas(std::move(g_replicas)) {}

Configuration::Configuration(std::istream &file) : g(0), n(0), f(-1) {
  int group = -1;
  std::string line;
  int lineno = 0;

  while (std::getline(file, line)) {
    ++lineno;
    // Strip comments
    std::string::size_type hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }

    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
      continue;
    }

    if (cmd == "f") {
      if (!(iss >> f) || f < 0) {
        Panic("Configuration line %d: 'f' requires a non-negative integer",
              lineno);
      }
    } else if (cmd == "group") {
      ++group;
      g_replicas[group];
    } else if (cmd == "replica") {
      if (group == -1) {
        // Implicit single group
        group = 0;
      }
      std::string arg;
      if (!(iss >> arg)) {
        Panic("Configuration line %d: 'replica' requires an address",
              lineno);
      }
      std::string::size_type colon = arg.rfind(':');
      if (colon == std::string::npos || colon == 0 ||
          colon == arg.size() - 1) {
        Panic("Configuration line %d: expected host:port, got '%s'", lineno,
              arg.c_str());
      }
      g_replicas[group].emplace_back(arg.substr(0, colon),
                                     arg.substr(colon + 1));
    } else {
      Panic("Unknown configuration directive on line %d: %s", lineno,
            cmd.c_str());
    }
  }

  g = static_cast<int>(g_replicas.size());
  if (g == 0) {
    Panic("Configuration did not specify any replicas");
  }

  n = static_cast<int>(g_replicas.begin()->second.size());
  for (const auto &kv : g_replicas) {
    if (static_cast<int>(kv.second.size()) != n) {
      Panic("All groups must contain the same number of replicas.");
    }
  }
  if (n == 0) {
    Panic("Configuration group does not contain any replicas");
  }

  if (f == -1) {
    f = (n - 1) / 2;
  }
}

Configuration::~Configuration() = default;

const ReplicaAddress &Configuration::replica(int group, int idx) const {
  auto itr = g_replicas.find(group);
  if (itr == g_replicas.end() || idx < 0 ||
      idx >= static_cast<int>(itr->second.size())) {
    Panic("No replica %d in group %d", idx, group);
  }
  return itr->second[idx];
}

bool Configuration::operator==(const Configuration &other) const {
  return n == other.n && f == other.f && g_replicas == other.g_replicas;
}

}  // namespace transport
