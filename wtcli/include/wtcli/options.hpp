// Copyright (c) 2025 <Your Name>
/**
 * @file options.hpp
 * @brief Immutable configuration for one `wt` invocation.
 */
#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "wtcore/timestamp.hpp"

namespace wtcli {

/**
 * @brief Immutable options for the command runner.
 *
 * Use the Builder to construct instances, or FromEnvironment() to read the
 * `WT_*` variables. All fields are read-only via getters.
 */
class Options {
 public:
  using LogCallback = std::function<void(const std::string&)>;
  /** Environment lookup; returns nullptr for unset variables. */
  using EnvLookup = std::function<const char*(const char*)>;

  /**
   * @brief Fluent builder for Options.
   */
  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** Directory holding the `.out/` storage folder (required). */
    Builder& Root(std::string v);
    /** Fixed "now" used instead of the local clock. */
    Builder& FixedNow(std::optional<wtcore::Timestamp> v);
    /** Daily report file path; empty selects `.out/daily-reports`. */
    Builder& ReportFile(std::string v);
    /** Answer yes to every confirmation prompt. */
    Builder& SkipPrompts(bool v);
    /** Receives one line per debug event. */
    Builder& LogSink(LogCallback cb);

    Options Build() const;

   private:
    std::string root_;
    std::optional<wtcore::Timestamp> fixed_now_;
    std::string report_file_;
    bool skip_prompts_;
    LogCallback log_sink_cb_;
  };

  Options();

  /**
   * @brief Read WT_ROOT, WT_MOCK_TIME, WT_REPORT_FILE and WT_SKIP_PROMPTS.
   *
   * @param out Options on success; untouched on failure.
   * @param err "Env $WT_ROOT not set." when the root is missing.
   * @param lookup Variable source (defaults to std::getenv).
   * @return false only when required configuration is missing.
   */
  static bool FromEnvironment(Options* out, std::string* err,
                              const EnvLookup& lookup = EnvLookup());

  /** @name Getters (immutable) */
  ///@{
  const std::string& Root() const { return root_; }
  const std::optional<wtcore::Timestamp>& FixedNow() const {
    return fixed_now_;
  }
  const std::string& ReportFile() const { return report_file_; }
  bool SkipPrompts() const { return skip_prompts_; }
  const LogCallback& LogSink() const { return log_callback_; }
  ///@}

  /** Stream formatter for the debug command. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  Options(std::string root, std::optional<wtcore::Timestamp> fixed_now,
          std::string report_file, bool skip_prompts, LogCallback log_cb);

  std::string root_;
  std::optional<wtcore::Timestamp> fixed_now_;
  std::string report_file_;
  bool skip_prompts_;
  LogCallback log_callback_;
};

}  // namespace wtcli
