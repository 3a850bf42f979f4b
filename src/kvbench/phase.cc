// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/phase.cc
 *   A phase of the benchmark workload
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

#include "kvbench/phase.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "lib/message.h"

namespace kvbench {

namespace {

bool ParseUint(const std::string &s, uint64_t *out) {
  if (s.empty() || s[0] == '-') {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  unsigned long long v = strtoull(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') {
    return false;
  }
  *out = v;
  return true;
}

bool ParseDouble(const std::string &s, double *out) {
  if (s.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  double v = strtod(s.c_str(), &end);
  if (errno != 0 || *end != '\0') {
    return false;
  }
  *out = v;
  return true;
}

}  // namespace

nlohmann::json Phase::ToJSON() const {
  return {{"duration_ms", duration_ms},
          {"read_ratio", read_ratio},
          {"request_delay_us", request_delay_us}};
}

bool ParsePhases(const std::string &phaseList,
                 std::vector<Phase> *phases) {
  phases->clear();
  if (phaseList.empty()) {
    return true;
  }

  std::stringstream ss(phaseList);
  std::string item;
  while (std::getline(ss, item, ',')) {
    std::stringstream fields(item);
    std::string duration, ratio, delay;
    if (std::count(item.begin(), item.end(), ':') != 2 ||
        !std::getline(fields, duration, ':') ||
        !std::getline(fields, ratio, ':') || !std::getline(fields, delay)) {
      Warning("Phase '%s' is not duration_ms:read_ratio:request_delay_us",
              item.c_str());
      return false;
    }

    Phase phase{};
    if (!ParseUint(duration, &phase.duration_ms) ||
        !ParseDouble(ratio, &phase.read_ratio) ||
        !ParseUint(delay, &phase.request_delay_us)) {
      Warning("Malformed number in phase '%s'", item.c_str());
      return false;
    }
    if (!(phase.read_ratio >= 0.0 && phase.read_ratio <= 1.0)) {
      Warning("Read ratio %f in phase '%s' is outside [0, 1]",
              phase.read_ratio, item.c_str());
      return false;
    }
    if (phase.request_delay_us == 0) {
      Warning("Request delay in phase '%s' must be positive", item.c_str());
      return false;
    }
    phases->push_back(phase);
  }

  // "a," leaves a dangling empty phase that getline does not report.
  if (phaseList.back() == ',') {
    Warning("Trailing ',' in phase list");
    return false;
  }
  return true;
}

}  // namespace kvbench
