// Copyright (c) 2025 <Your Name>
/**
 * @file command_runner.hpp
 * @brief Dispatch of `wt` command lines onto the timer engine.
 *
 * One Run() call is one invocation: the clock is sampled once, the
 * aggregate is loaded, at most one transition or edit is applied, and the
 * result is persisted before any output is written.
 */
#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "wtcli/options.hpp"
#include "wtcore/time_source.hpp"

namespace wtcli {

/**
 * @brief Executes `wt` commands against the store described by Options.
 *
 * Exit codes: 0 on success and on rejected operations (validation, state or
 * range errors, reported on `out`), 1 on missing timer or storage failure
 * (reported on `err`), 2 on an unknown command.
 */
class CommandRunner {
 public:
  /**
   * @param opt Storage root, prompt behavior and debug log sink.
   * @param time_source Clock to sample (not owned, must outlive Run()).
   * @param in Answers to confirmation prompts.
   * @param out Normal output.
   * @param err Fatal error output.
   */
  CommandRunner(const Options& opt, wtcore::TimeSource* time_source,
                std::istream& in, std::ostream& out, std::ostream& err);
  ~CommandRunner();

  CommandRunner(const CommandRunner&) = delete;
  CommandRunner& operator=(const CommandRunner&) = delete;

  /**
   * @brief Run one command.
   * @param args Command and its arguments (argv without the program name).
   *             Empty means `check`.
   * @return Process exit code.
   */
  int Run(const std::vector<std::string>& args);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/** Top-level usage text for `wt help`. */
std::string UsageText();

}  // namespace wtcli
