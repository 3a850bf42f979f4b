// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/client_config.h
 *   Settings of one benchmark client run
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

#ifndef KVBENCH_CLIENT_CONFIG_H_
#define KVBENCH_CLIENT_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock/clock_config.h"
#include "kvbench/phase.h"

namespace kvbench {

struct ClientConfig {
  uint64_t client_id = 0;
  int server_id = 0;
  // Filled in from the replica configuration, for the summary only.
  std::string server_address;

  std::vector<Phase> phases;

  std::string output_filepath;
  std::string summary_filepath;

  bool correctness_check = false;
  std::string history_output_path;

  ClockConfig clock;

  // Milliseconds from receipt of the start signal to the scheduled start.
  // Negative if the signal arrived late. Unset until the run starts.
  std::optional<int64_t> sync_time_ms;

  // Default history path for a client: logs/history-<client_id>.json.
  static std::string DefaultHistoryPath(uint64_t clientId);

  nlohmann::json ToJSON() const;
};

}  // namespace kvbench

#endif  // KVBENCH_CLIENT_CONFIG_H_
