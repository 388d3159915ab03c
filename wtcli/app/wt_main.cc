// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief `wt` work timer command line.
 *
 * Usage:
 *   WT_ROOT=/path/to/project wt start 0915
 *   wt pause
 *   wt log
 *
 * Environment:
 *   WT_ROOT          storage root (required)
 *   WT_MOCK_TIME     fixed "YYYY-MM-DD HH:MM" instead of the local clock
 *   WT_REPORT_FILE   daily report path (default .out/daily-reports)
 *   WT_SKIP_PROMPTS  answer yes to confirmations when non-empty
 */

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "wtcli/command_runner.hpp"
#include "wtcli/options.hpp"
#include "wtcli/timer_store.hpp"
#include "wtcore/platform/default_time_source.hpp"

namespace {
/**
 * @brief Appends command events to the debug log.
 */
class DebugLogger {
 public:
  explicit DebugLogger(const wtcli::Options& opt) : store_(opt) {}

  void Log(const std::string& msg) {
    wtcore::Outcome r = store_.AppendDebug(msg);
    if (!r.ok()) std::fprintf(stderr, "%s\n", r.message.c_str());
  }

 private:
  wtcli::TimerStore store_;
};

void PrintUsage() { std::fprintf(stderr, "%s", wtcli::UsageText().c_str()); }
}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (!args.empty() &&
      (args[0] == "help" || args[0] == "-h" || args[0] == "--help")) {
    std::printf("%s", wtcli::UsageText().c_str());
    return 0;
  }

  wtcli::Options env;
  std::string err;
  if (!wtcli::Options::FromEnvironment(&env, &err)) {
    std::fprintf(stderr, "%s\n", err.c_str());
    PrintUsage();
    return 1;
  }

  // Create logger
  DebugLogger logger(env);
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };
  auto opt = wtcli::Options::Builder(env).LogSink(log_callback).Build();

  std::unique_ptr<wtcore::TimeSource> clock =
      wtcore::platform::CreateDefaultTimeSource(opt.FixedNow());
  wtcli::CommandRunner runner(opt, clock.get(), std::cin, std::cout,
                              std::cerr);
  return runner.Run(args);
}
