// Copyright (c) 2025 <Your Name>
/**
 * @file timer_store.hpp
 * @brief File-backed storage for the timer aggregate and its side files.
 *
 * Layout under `<root>/.out/`:
 *
 *   - wt.json        encoded Timer (see TimerCodec)
 *   - debug-log      one `[YYYY-MM-DD HH:MM] wt <args>` line per command
 *   - daily-reports  report lines, newest first (path overridable)
 */
#pragma once

#include <memory>
#include <string>

#include "wtcli/options.hpp"
#include "wtcore/error.hpp"
#include "wtcore/timer.hpp"

namespace wtcli {

/**
 * @brief Loads and saves the Timer and manages the `.out/` folder.
 *
 * Every operation returns an Outcome; failures carry kNotFound or kIo and
 * leave output arguments untouched.
 */
class TimerStore {
 public:
  explicit TimerStore(const Options& opt);
  ~TimerStore();

  TimerStore(const TimerStore&) = delete;
  TimerStore& operator=(const TimerStore&) = delete;

  /** @name Paths */
  ///@{
  std::string OutputDir() const;
  std::string DataFile() const;
  std::string DebugLogFile() const;
  std::string ReportFile() const;
  ///@}

  /** True when the aggregate file exists. */
  bool Exists() const;

  /**
   * @brief Read and decode the aggregate.
   * @param out Timer on success; untouched on failure.
   * @return kNotFound ("No timer exists.") without a file, kIo on read or
   *         decode failures.
   */
  wtcore::Outcome Load(wtcore::Timer* out) const;

  /** Encode and write the aggregate, creating `.out/` when missing. */
  wtcore::Outcome Save(const wtcore::Timer& t) const;

  /**
   * @brief Recreate `.out/` from scratch.
   *
   * The daily report content survives; the debug log is left empty.
   */
  wtcore::Outcome ResetFiles() const;

  /** Delete the aggregate, the debug log and the daily report. */
  wtcore::Outcome Remove() const;

  /** Append one line (a newline is added) to the debug log. */
  wtcore::Outcome AppendDebug(const std::string& line) const;

  /** Read the whole debug log. */
  wtcore::Outcome ReadDebug(std::string* out) const;

  /** Insert one line (a newline is added) at the top of the daily report. */
  wtcore::Outcome PrependReport(const std::string& line) const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace wtcli
