// Copyright (c) 2025 <Your Name>
/**
 * @test Command line end to end
 * @brief Runs `wt` commands against a temporary root with a fixed clock.
 * @steps
 *  1) Each Run() builds a fresh CommandRunner, like one process invocation.
 *  2) The clock is moved between commands with FixedTimeSource::Set().
 *  3) Output, exit codes, stored state and the debug log are inspected.
 */
#include "wtcli/command_runner.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "wtcli/timer_store.hpp"

namespace fs = std::filesystem;

using wtcore::Timestamp;

namespace {

Timestamp At(int h, int m) { return Timestamp::FromCivil(2025, 1, 6, h, m); }

class CommandRunnerTest : public ::testing::Test {
 protected:
  CommandRunnerTest() : clock_(At(9, 0)) {}

  void SetUp() override {
    root_ = fs::temp_directory_path() /
            (std::string("wtcli_runner_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }
  void TearDown() override { fs::remove_all(root_); }

  wtcli::Options BaseOptions() const {
    return wtcli::Options::Builder()
        .Root(root_.string())
        .SkipPrompts(skip_prompts_)
        .Build();
  }

  int Run(const std::vector<std::string>& args) {
    out_.str("");
    err_.str("");
    wtcli::TimerStore store(BaseOptions());
    auto opts = wtcli::Options::Builder(BaseOptions())
                    .LogSink([this, &store](const std::string& line) {
                      logged_.push_back(line);
                      EXPECT_TRUE(store.AppendDebug(line).ok());
                    })
                    .Build();
    wtcli::CommandRunner runner(opts, &clock_, in_, out_, err_);
    return runner.Run(args);
  }

  int RunAt(int h, int m, const std::vector<std::string>& args) {
    clock_.Set(At(h, m));
    return Run(args);
  }

  std::string Out() const { return out_.str(); }
  std::string Err() const { return err_.str(); }

  void Answer(const std::string& text) {
    in_.clear();
    in_.str(text);
  }

  fs::path root_;
  bool skip_prompts_ = true;
  wtcore::FixedTimeSource clock_;
  std::istringstream in_;
  std::ostringstream out_;
  std::ostringstream err_;
  std::vector<std::string> logged_;
};

}  // namespace

TEST_F(CommandRunnerTest, MissingTimerIsFatal) {
  EXPECT_EQ(Run({"start"}), 1);
  EXPECT_EQ(Err(), "No timer exists.\n");
  EXPECT_EQ(Out(), "");
  EXPECT_TRUE(logged_.empty());

  EXPECT_EQ(Run({}), 1);
  EXPECT_EQ(Err(), "No timer exists.\n");
}

TEST_F(CommandRunnerTest, StatusWithoutTimer) {
  EXPECT_EQ(Run({"status"}), 0);
  EXPECT_EQ(Out(), "stopped\n");
}

/**
 * @test CommandRunnerTest.TwoCyclesWithBreak
 * @brief start 09:00, stop 09:30, start 09:45, stop 10:00 through `wt`.
 * @expected `wt log` shows three projected lines; every change is logged.
 */
TEST_F(CommandRunnerTest, TwoCyclesWithBreak) {
  ASSERT_EQ(Run({"new"}), 0);
  EXPECT_EQ(Out(), "");  // silent by default

  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);
  ASSERT_EQ(RunAt(9, 45, {"start"}), 0);
  ASSERT_EQ(RunAt(10, 0, {"stop"}), 0);

  ASSERT_EQ(RunAt(12, 0, {"log"}), 0);
  EXPECT_EQ(Out(),
            "01. [09:00 => 09:30] Work: 0h:30m (0h:30m)\n"
            "02. [09:30 => 09:45] Break: 0h:15m\n"
            "03. [09:45 => 10:00] Work: 0h:15m (0h:45m)\n");

  ASSERT_EQ(Run({"report"}), 0);
  EXPECT_EQ(Out(),
            "2025-01-06 | 09:00 -> 10:00 | Work: 0h:45m | Break: 0h:15m | "
            "Paused: 0h:00m | Total: 1h:00m\n");

  ASSERT_EQ(Run({"check"}), 0);
  EXPECT_EQ(Out(), "--:-- STOPPED (0h 45m)\n");

  const std::vector<std::string> expected = {
      "[2025-01-06 09:00] wt start",
      "[2025-01-06 09:30] wt stop",
      "[2025-01-06 09:45] wt start",
      "[2025-01-06 10:00] wt stop",
  };
  EXPECT_EQ(logged_, expected);

  ASSERT_EQ(Run({"log", "debug"}), 0);
  EXPECT_EQ(Out(),
            "[2025-01-06 09:00] wt start\n[2025-01-06 09:30] wt stop\n"
            "[2025-01-06 09:45] wt start\n[2025-01-06 10:00] wt stop\n");
}

TEST_F(CommandRunnerTest, PauseAndResume) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 10, {"pause"}), 0);
  ASSERT_EQ(RunAt(9, 20, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 25, {"stop"}), 0);
  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "01. [09:00 => 09:25] Work: 0h:15m |10m| (0h:15m)\n");
}

TEST_F(CommandRunnerTest, ModeControlsMessages) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(Run({"mode"}), 0);
  EXPECT_EQ(Out(), "silent\n");

  ASSERT_EQ(Run({"mode", "normal"}), 0);
  EXPECT_EQ(Out(), "Timer mode set to normal\n");
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  EXPECT_EQ(Out(), "Starting timer.\n");

  ASSERT_EQ(Run({"mode", "verbose"}), 0);
  ASSERT_EQ(RunAt(9, 10, {"pause"}), 0);
  EXPECT_EQ(Out(), "Paused timer\n0h 10m PAUSED (0h 10m)\n");

  ASSERT_EQ(Run({"mode", "loud"}), 0);
  EXPECT_EQ(Out(), "Unhandled mode: loud\n");
  ASSERT_EQ(Run({"mode"}), 0);
  EXPECT_EQ(Out(), "verbose\n");
}

/**
 * @test CommandRunnerTest.DurationFloor
 * @brief `wt mod 1 sub 45` on a 30 minute Work cycle.
 * @expected Rejected with exit 0; the stored cycle and debug log unchanged.
 */
TEST_F(CommandRunnerTest, DurationFloor) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);
  logged_.clear();

  EXPECT_EQ(Run({"mod", "1", "sub", "45"}), 0);
  EXPECT_EQ(Out(), "Error: Duration would be negative. Current: 0h:30m\n");
  EXPECT_TRUE(logged_.empty());

  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "01. [09:00 => 09:30] Work: 0h:30m (0h:30m)\n");
}

TEST_F(CommandRunnerTest, DropBreakMergesWork) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 20, {"stop"}), 0);
  ASSERT_EQ(RunAt(9, 25, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 40, {"stop"}), 0);
  ASSERT_EQ(Run({"mode", "normal"}), 0);

  ASSERT_EQ(Run({"mod", "2", "drop"}), 0);
  EXPECT_EQ(Out(), "Removed cycle 2 (merged adjacent work cycles: 0h:40m)\n");
  EXPECT_EQ(logged_.back(), "[2025-01-06 09:40] wt mod 2 drop");

  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "01. [09:00 => 09:40] Work: 0h:40m (0h:40m)\n");
}

TEST_F(CommandRunnerTest, ModListingAndEdits) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);

  ASSERT_EQ(Run({"mod"}), 0);
  EXPECT_EQ(Out().rfind("01. [09:00 => 09:30] Work: 0h:30m (0h:30m)\n\n"
                        "Usage:\n",
                        0),
            0u);

  ASSERT_EQ(Run({"mod", "start", "sub", "15"}), 0);
  ASSERT_EQ(Run({"mod", "1", "pause", "add", "5"}), 0);
  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "01. [08:45 => 09:20] Work: 0h:30m |05m| (0h:30m)\n");

  EXPECT_EQ(Run({"mod", "2", "add", "5"}), 0);
  EXPECT_EQ(Out(), "Cycle 2 does not exist. Valid range: 1-1\n");
}

TEST_F(CommandRunnerTest, InvalidArgumentsAreReported) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);

  EXPECT_EQ(Run({"mod", "x", "add", "5"}), 0);
  EXPECT_EQ(Out(), "Invalid cycle number: x\n");
  EXPECT_EQ(Run({"mod", "1", "plus", "5"}), 0);
  EXPECT_EQ(Out(), "Invalid operation: plus. Use 'add' or 'sub'\n");
  EXPECT_EQ(Run({"start", "99"}), 0);
  EXPECT_EQ(Out(), "Incorrect time format. Minutes cannot exceed 59.\n");
  EXPECT_EQ(Run({"log", "verbose"}), 0);
  EXPECT_EQ(Out(), "Invalid log type: verbose. Use one of: ['info', 'debug']\n");
  EXPECT_EQ(Run({"next"}), 0);
  EXPECT_EQ(Out(), "Timer already stopped.\n");
}

/**
 * @test CommandRunnerTest.ResetAsksFirst
 * @brief `wt reset` prompts unless prompts are skipped.
 * @expected "n" keeps the day; "y" archives it to the daily report.
 */
TEST_F(CommandRunnerTest, ResetAsksFirst) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(Run({"mode", "normal"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);

  skip_prompts_ = false;
  Answer("n\n");
  ASSERT_EQ(RunAt(17, 0, {"reset"}), 0);
  EXPECT_EQ(Out(), "Reset timer? y / n [n]: ");
  ASSERT_EQ(Run({"check"}), 0);
  EXPECT_EQ(Out(), "--:-- STOPPED (0h 30m)\n");

  Answer("y\n");
  ASSERT_EQ(Run({"reset"}), 0);
  EXPECT_EQ(Out(), "Reset timer? y / n [n]: Timer reset.\n");
  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "No work cycles recorded.\n");
  ASSERT_EQ(Run({"mode"}), 0);
  EXPECT_EQ(Out(), "normal\n");

  std::ifstream report(root_ / ".out" / "daily-reports");
  std::string line;
  ASSERT_TRUE(static_cast<bool>(std::getline(report, line)));
  EXPECT_EQ(line,
            "2025-01-06 | 09:00 -> 09:30 | Work: 0h:30m | Break: 0h:00m | "
            "Paused: 0h:00m | Total: 0h:30m");
}

TEST_F(CommandRunnerTest, RestartWithBackdate) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(RunAt(9, 0, {"start"}), 0);
  ASSERT_EQ(RunAt(9, 30, {"stop"}), 0);

  ASSERT_EQ(RunAt(10, 0, {"restart", "15"}), 0);
  ASSERT_EQ(Run({"status"}), 0);
  EXPECT_EQ(Out(), "running\n");
  ASSERT_EQ(Run({"log"}), 0);
  EXPECT_EQ(Out(), "01. [09:45 => .....] Work: 0h:15m (0h:15m)\n");
}

TEST_F(CommandRunnerTest, RemoveDeletesTimer) {
  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(Run({"remove"}), 0);
  EXPECT_FALSE(fs::exists(root_ / ".out" / "wt.json"));
  ASSERT_EQ(Run({"status"}), 0);
  EXPECT_EQ(Out(), "stopped\n");
  EXPECT_EQ(Run({"remove"}), 1);
}

TEST_F(CommandRunnerTest, DebugPrintsStorage) {
  ASSERT_EQ(Run({"debug"}), 0);
  EXPECT_NE(Out().find("No file at"), std::string::npos);

  ASSERT_EQ(Run({"new"}), 0);
  ASSERT_EQ(Run({"debug"}), 0);
  EXPECT_EQ(Out().rfind("output_file_path() = ", 0), 0u);
  EXPECT_NE(Out().find("\"status\": \"stopped\""), std::string::npos);
}

TEST_F(CommandRunnerTest, UnknownCommand) {
  EXPECT_EQ(Run({"fly"}), 2);
  EXPECT_EQ(Err().rfind("Unknown command: fly\n", 0), 0u);
  EXPECT_EQ(Run({"help"}), 0);
  EXPECT_EQ(Out().rfind("Usage: wt", 0), 0u);
}
