// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * kvbench/benchmark.cc
 *   Runs one key-value benchmark client against a server
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

#include <gflags/gflags.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "clock/clock_config.h"
#include "clock/clocksim.h"
#include "correctness/operation_history.h"
#include "kvbench/client_config.h"
#include "kvbench/kv_client.h"
#include "kvbench/phase.h"
#include "lib/configuration.h"
#include "lib/message.h"
#include "lib/tcptransport.h"

/**
 * Client settings.
 */
DEFINE_uint64(client_id, 0, "unique identifier for client");
DEFINE_string(config_path, "", "path to server configuration file");
DEFINE_int32(server_id, 0, "index of the server (in group 0) to send to");

static bool ValidatePhases(const char *flagname, const std::string &value) {
  std::vector<kvbench::Phase> phases;
  if (kvbench::ParsePhases(value, &phases)) {
    return true;
  }
  std::cerr << "Invalid value for --" << flagname << ": " << value
            << std::endl;
  return false;
}
DEFINE_string(phases, "",
              "comma-separated workload phases, each "
              "duration_ms:read_ratio:request_delay_us");
DEFINE_validator(phases, &ValidatePhases);

/**
 * Output settings.
 */
DEFINE_string(output_filepath, "client-data.csv",
              "path to the per-request CSV output");
DEFINE_string(summary_filepath, "client-summary.json",
              "path to the run summary output");
DEFINE_bool(correctness_check, false,
            "record an operation history for linearizability checking");
DEFINE_string(history_output_path, "",
              "path to the operation history (default "
              "logs/history-<client_id>.json)");

/**
 * Clock settings.
 */
DEFINE_string(clock_config_path, "",
              "path to the simulated clock configuration (defaults are used "
              "if empty)");

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "issues a phased mix of reads and writes against a key-value\n"
      "           server and records per-request latencies.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_config_path.empty()) {
    std::cerr << "Must specify --config_path" << std::endl;
    return 1;
  }
  std::ifstream configStream(FLAGS_config_path);
  if (configStream.fail()) {
    std::cerr << "Unable to read configuration file: " << FLAGS_config_path
              << std::endl;
    return -1;
  }
  transport::Configuration config(configStream);

  if (FLAGS_server_id < 0 || FLAGS_server_id >= config.n) {
    std::cerr << "Server " << FLAGS_server_id << " is not in the "
              << config.n << "-replica configuration" << std::endl;
    return 1;
  }

  kvbench::ClientConfig clientConfig;
  clientConfig.client_id = FLAGS_client_id;
  clientConfig.server_id = FLAGS_server_id;
  clientConfig.output_filepath = FLAGS_output_filepath;
  clientConfig.summary_filepath = FLAGS_summary_filepath;
  clientConfig.correctness_check = FLAGS_correctness_check;
  clientConfig.history_output_path =
      FLAGS_history_output_path.empty()
          ? kvbench::ClientConfig::DefaultHistoryPath(FLAGS_client_id)
          : FLAGS_history_output_path;
  if (!kvbench::ParsePhases(FLAGS_phases, &clientConfig.phases)) {
    std::cerr << "Invalid phases: " << FLAGS_phases << std::endl;
    return 1;
  }

  if (!FLAGS_clock_config_path.empty()) {
    std::ifstream clockStream(FLAGS_clock_config_path);
    if (clockStream.fail()) {
      std::cerr << "Unable to read clock configuration file: "
                << FLAGS_clock_config_path << std::endl;
      return -1;
    }
    clientConfig.clock = ClockConfig(clockStream);
  }
  clientConfig.clock.ApplyEnvironmentOverrides();
  Notice("Simulated clock: drift %.1f us/s, uncertainty %.1f us, sync %.1f Hz",
         clientConfig.clock.drift_rate, clientConfig.clock.uncertainty_bound,
         clientConfig.clock.sync_freq);

  ClockSim clock(clientConfig.clock.drift_rate,
                 clientConfig.clock.uncertainty_bound,
                 clientConfig.clock.sync_freq);

  std::unique_ptr<correctness::HistoryRecorder> history;
  if (FLAGS_correctness_check) {
    history.reset(new correctness::OperationHistory(FLAGS_client_id));
  }

  TCPTransport tport;
  kvbench::KVClient client(config, &tport, clientConfig, &clock,
                           std::move(history));

  bool finished = false;
  bool saved = false;
  client.Start([&finished, &saved](bool ok) {
    finished = true;
    saved = ok;
  });

  tport.Run();

  if (!finished) {
    Warning("Stopped before the run finished; no results written");
    return 1;
  }
  if (!saved) {
    Warning("Failed to save results");
    return 1;
  }

  Notice("Cleaning up after experiment.");
  return 0;
}
