// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * clock/clock_config.cc
 *   Parameters of the simulated clock, loaded from a file with
 *   environment variable overrides
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

#include "clock/clock_config.h"

#include <cstdlib>
#include <string>

#include "lib/message.h"

namespace {

std::string Trim(const std::string &s) {
  const char *ws = " \t\r\n";
  std::string::size_type b = s.find_first_not_of(ws);
  if (b == std::string::npos) {
    return "";
  }
  std::string::size_type e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool ParseDouble(const std::string &s, double *out) {
  if (s.empty()) {
    return false;
  }
  char *end = nullptr;
  *out = strtod(s.c_str(), &end);
  return end != nullptr && *end == '\0';
}

void OverrideFromEnv(const char *name, double *value) {
  const char *env = getenv(name);
  if (env == nullptr) {
    return;
  }
  if (!ParseDouble(Trim(env), value)) {
    Panic("Invalid value for %s: '%s'", name, env);
  }
  Debug("Clock parameter overridden by %s=%f", name, *value);
}

}  // namespace

ClockConfig::ClockConfig()
    : drift_rate(kDefaultDriftRate),
      uncertainty_bound(kDefaultUncertaintyBound),
      sync_freq(kDefaultSyncFreq) {}

ClockConfig::ClockConfig(std::istream &file) : ClockConfig() {
  std::string line;
  std::string section;
  int lineno = 0;

  while (std::getline(file, line)) {
    ++lineno;
    std::string::size_type hash = line.find('#');
    if (hash != std::string::npos) {
      line.erase(hash);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']') {
        Panic("Clock config line %d: malformed section header", lineno);
      }
      section = Trim(line.substr(1, line.size() - 2));
      continue;
    }
    if (!section.empty() && section != "clock") {
      continue;
    }

    std::string::size_type sep = line.find('=');
    if (sep == std::string::npos) {
      sep = line.find_first_of(" \t");
    }
    if (sep == std::string::npos) {
      Panic("Clock config line %d: expected 'key = value'", lineno);
    }
    std::string key = Trim(line.substr(0, sep));
    std::string value = Trim(line.substr(sep + 1));

    double *field;
    if (key == "drift_rate") {
      field = &drift_rate;
    } else if (key == "uncertainty_bound") {
      field = &uncertainty_bound;
    } else if (key == "sync_freq") {
      field = &sync_freq;
    } else {
      Panic("Clock config line %d: unknown key '%s'", lineno, key.c_str());
    }

    if (!ParseDouble(value, field)) {
      Panic("Clock config line %d: invalid number '%s' for %s", lineno,
            value.c_str(), key.c_str());
    }
  }
}

void ClockConfig::ApplyEnvironmentOverrides() {
  OverrideFromEnv(kDriftRateEnv, &drift_rate);
  OverrideFromEnv(kUncertaintyBoundEnv, &uncertainty_bound);
  OverrideFromEnv(kSyncFreqEnv, &sync_freq);
}

nlohmann::json ClockConfig::ToJSON() const {
  return nlohmann::json{{"drift_rate", drift_rate},
                        {"uncertainty_bound", uncertainty_bound},
                        {"sync_freq", sync_freq}};
}
