// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/client_config.cc
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

#include "kvbench/client_config.h"

namespace kvbench {

std::string ClientConfig::DefaultHistoryPath(uint64_t clientId) {
  return "logs/history-" + std::to_string(clientId) + ".json";
}

nlohmann::json ClientConfig::ToJSON() const {
  nlohmann::json phasesJSON = nlohmann::json::array();
  for (const auto &phase : phases) {
    phasesJSON.push_back(phase.ToJSON());
  }

  nlohmann::json j = {{"client_id", client_id},
                      {"server_id", server_id},
                      {"server_address", server_address},
                      {"phases", std::move(phasesJSON)},
                      {"output_filepath", output_filepath},
                      {"summary_filepath", summary_filepath},
                      {"correctness_check", correctness_check},
                      {"clock", clock.ToJSON()}};
  if (correctness_check) {
    j["history_output_path"] = history_output_path;
  }
  if (sync_time_ms) {
    j["sync_time_ms"] = *sync_time_ms;
  } else {
    j["sync_time_ms"] = nullptr;
  }
  return j;
}

}  // namespace kvbench
