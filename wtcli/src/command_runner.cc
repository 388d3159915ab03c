// Copyright (c) 2025 <Your Name>
#include "wtcli/command_runner.hpp"

#include <cctype>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "wtcli/renderer.hpp"
#include "wtcli/timer_codec.hpp"
#include "wtcli/timer_store.hpp"
#include "wtcore/duration_text.hpp"
#include "wtcore/mutation.hpp"
#include "wtcore/state_machine.hpp"

namespace wtcli {

using wtcore::ErrorCode;
using wtcore::Outcome;
using wtcore::Timer;

namespace {

using Operation = std::function<Outcome(Timer*)>;

std::string Join(const std::vector<std::string>& args) {
  std::string s;
  for (const std::string& a : args) {
    if (!s.empty()) s += ' ';
    s += a;
  }
  return s;
}

// Optional HHMM argument at position `at`.
Outcome OptionalMinutes(const std::vector<std::string>& args, size_t at,
                        std::optional<int>* out) {
  if (args.size() <= at) return Outcome::Applied("");
  int minutes = 0;
  std::string err;
  if (!wtcore::ParseMinutes(args[at], &minutes, &err)) {
    return Outcome::Fail(ErrorCode::kValidation, err);
  }
  *out = minutes;
  return Outcome::Applied("");
}

Outcome ParseIndex(const std::string& text, size_t* out) {
  bool digits = !text.empty() && text.size() <= 6;
  for (char c : text) {
    digits = digits && std::isdigit(static_cast<unsigned char>(c));
  }
  if (!digits) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Invalid cycle number: " + text);
  }
  *out = static_cast<size_t>(std::stoul(text));
  return Outcome::Applied("");
}

Outcome ParseDirectionArg(const std::string& text,
                          wtcore::Direction* out) {
  if (!wtcore::ParseDirection(text, out)) {
    return Outcome::Fail(ErrorCode::kValidation,
                         "Invalid operation: " + text +
                             ". Use 'add' or 'sub'");
  }
  return Outcome::Applied("");
}

Outcome ParseMinutesArg(const std::string& text, int* out) {
  std::string err;
  if (!wtcore::ParseMinutes(text, out, &err)) {
    return Outcome::Fail(ErrorCode::kValidation, err);
  }
  return Outcome::Applied("");
}

}  // namespace

struct CommandRunner::Impl {
  Impl(const Options& o, wtcore::TimeSource* ts, std::istream& i,
       std::ostream& ou, std::ostream& er)
      : opt(o), store(o), time_source(ts), in(i), out(ou), err(er) {}

  Options opt;
  TimerStore store;
  wtcore::TimeSource* time_source;
  std::istream& in;
  std::ostream& out;
  std::ostream& err;

  wtcore::Timestamp now;
  std::vector<std::string> args;

  // Prints a rejected outcome and maps it to an exit code.
  int Reject(const Outcome& o) {
    if (wtcore::IsFatal(o.code)) {
      err << o.message << "\n";
      return 1;
    }
    out << o.message << "\n";
    return 0;
  }

  void LogCommand() {
    if (opt.LogSink()) {
      opt.LogSink()("[" + now.ToString() + "] wt " + Join(args));
    }
  }

  void Announce(const Timer& t, const std::string& message) {
    if (t.mode == wtcore::Mode::kSilent) return;
    out << message << "\n";
    if (t.mode == wtcore::Mode::kVerbose) out << RenderCheck(t, now) << "\n";
  }

  bool Confirm(const std::string& question) {
    if (opt.SkipPrompts()) return true;
    out << question << " y / n [n]: " << std::flush;
    std::string answer;
    std::getline(in, answer);
    return answer == "y" || answer == "Y";
  }

  // load -> op -> save -> log -> announce
  int Apply(const Operation& op) {
    Timer t;
    Outcome loaded = store.Load(&t);
    if (!loaded.ok()) return Reject(loaded);

    Outcome r = op(&t);
    if (!r.ok()) return Reject(r);

    Outcome saved = store.Save(t);
    if (!saved.ok()) return Reject(saved);
    LogCommand();
    Announce(t, r.message);
    return 0;
  }

  // Read-only commands.
  int View(const std::function<void(const Timer&)>& show) {
    Timer t;
    Outcome loaded = store.Load(&t);
    if (!loaded.ok()) return Reject(loaded);
    show(t);
    return 0;
  }

  // Returns false (with *code set) when the reset did not happen.
  bool ResetTimer(const std::string& message, int* code) {
    wtcore::Mode mode = wtcore::Mode::kSilent;
    if (store.Exists()) {
      Timer old;
      Outcome loaded = store.Load(&old);
      if (!loaded.ok()) {
        *code = Reject(loaded);
        return false;
      }
      if (!Confirm("Reset timer?")) {
        *code = 0;
        return false;
      }
      mode = old.mode;
      if (old.anchor_time) {
        Outcome r = store.PrependReport(RenderReport(old, now));
        if (!r.ok()) {
          *code = Reject(r);
          return false;
        }
      }
    }

    Outcome r = store.ResetFiles();
    if (r.ok()) r = store.Save(wtcore::MakeEmptyTimer(mode));
    if (!r.ok()) {
      *code = Reject(r);
      return false;
    }
    Announce(wtcore::MakeEmptyTimer(mode), message);
    *code = 0;
    return true;
  }

  int Start() {
    return Apply([this](Timer* t) {
      std::optional<int> backdate;
      Outcome parsed = OptionalMinutes(args, 1, &backdate);
      if (!parsed.ok()) return parsed;
      return wtcore::Start(t, now, backdate);
    });
  }

  int Pause() {
    return Apply([this](Timer* t) {
      std::optional<int> add;
      Outcome parsed = OptionalMinutes(args, 1, &add);
      if (!parsed.ok()) return parsed;
      return wtcore::Pause(t, now, add);
    });
  }

  int ShowLog(const std::string& type) {
    if (!type.empty() && type != "info" && type != "debug") {
      out << "Invalid log type: " << type
          << ". Use one of: ['info', 'debug']\n";
      return 0;
    }
    Timer t;
    Outcome r = store.Load(&t);
    if (!r.ok()) return Reject(r);

    if (type == "debug") {
      std::string text;
      r = store.ReadDebug(&text);
      if (!r.ok()) return Reject(r);
      out << text;
      return 0;
    }
    for (const std::string& line : RenderLog(t, now)) out << line << "\n";
    return 0;
  }

  int Mod() {
    const std::vector<std::string> m(args.begin() + 1, args.end());
    if (m.size() == 3 && m[0] == "start") {
      return Apply([&](Timer* t) {
        wtcore::Direction dir = wtcore::Direction::kAdd;
        int minutes = 0;
        Outcome r = ParseDirectionArg(m[1], &dir);
        if (r.ok()) r = ParseMinutesArg(m[2], &minutes);
        if (!r.ok()) return r;
        return wtcore::ModStart(t, dir, minutes);
      });
    }
    if (m.size() == 2 && m[1] == "drop") {
      return Apply([&](Timer* t) {
        size_t index = 0;
        Outcome r = ParseIndex(m[0], &index);
        if (!r.ok()) return r;
        return wtcore::DropEntry(t, index, now);
      });
    }
    if (m.size() == 4 && m[1] == "pause") {
      return Apply([&](Timer* t) {
        size_t index = 0;
        wtcore::Direction dir = wtcore::Direction::kAdd;
        int minutes = 0;
        Outcome r = ParseIndex(m[0], &index);
        if (r.ok()) r = ParseDirectionArg(m[2], &dir);
        if (r.ok()) r = ParseMinutesArg(m[3], &minutes);
        if (!r.ok()) return r;
        return wtcore::ModPause(t, index, dir, minutes);
      });
    }
    if (m.size() == 3) {
      return Apply([&](Timer* t) {
        size_t index = 0;
        wtcore::Direction dir = wtcore::Direction::kAdd;
        int minutes = 0;
        Outcome r = ParseIndex(m[0], &index);
        if (r.ok()) r = ParseDirectionArg(m[1], &dir);
        if (r.ok()) r = ParseMinutesArg(m[2], &minutes);
        if (!r.ok()) return r;
        return wtcore::ModDuration(t, index, dir, minutes);
      });
    }

    return View([&](const Timer& t) {
      if (!t.timeline.empty() || t.IsOpen()) {
        for (const std::string& line : RenderLog(t, now)) {
          out << line << "\n";
        }
        out << "\n";
      }
      out << RenderModUsage() << "\n";
    });
  }

  int Restart() {
    std::optional<int> backdate;
    Outcome parsed = OptionalMinutes(args, 1, &backdate);
    if (!parsed.ok()) return Reject(parsed);

    int code = 0;
    if (!ResetTimer("Timer reset.", &code)) return code;
    return Apply([&](Timer* t) { return wtcore::Start(t, now, backdate); });
  }

  int Remove() {
    Timer t;
    Outcome loaded = store.Load(&t);
    if (!loaded.ok()) return Reject(loaded);
    if (!Confirm("Remove timer?")) return 0;
    Outcome r = store.Remove();
    if (!r.ok()) return Reject(r);
    Announce(t, "Timer removed.");
    return 0;
  }

  int Status() {
    if (!store.Exists()) {
      out << wtcore::ToString(wtcore::TimerStatus::kStopped) << "\n";
      return 0;
    }
    return View([&](const Timer& t) {
      out << wtcore::ToString(t.status) << "\n";
    });
  }

  int SetMode() {
    if (args.size() < 2) {
      return View([&](const Timer& t) {
        out << wtcore::ToString(t.mode) << "\n";
      });
    }
    wtcore::Mode mode = wtcore::Mode::kSilent;
    if (!wtcore::ParseMode(args[1], &mode)) {
      out << "Unhandled mode: " << args[1] << "\n";
      return 0;
    }

    Timer t;
    Outcome r = store.Load(&t);
    if (r.ok()) {
      t.mode = mode;
      r = store.Save(t);
    }
    if (!r.ok()) return Reject(r);
    if (t.mode != wtcore::Mode::kSilent) {
      out << "Timer mode set to " << wtcore::ToString(t.mode) << "\n";
    }
    return 0;
  }

  int Debug() {
    out << "output_file_path() = " << store.DataFile() << "\n"
        << "options = " << opt << "\n";
    if (!store.Exists()) {
      out << "No file at " << store.DataFile() << "\n";
      return 0;
    }
    return View([&](const Timer& t) {
      out << TimerCodec::Serialize(t) << "\n" << t << "\n";
    });
  }

  int Dispatch() {
    const std::string cmd = args.empty() ? "check" : args[0];
    const std::string arg1 = args.size() > 1 ? args[1] : std::string();
    int code = 0;

    if (cmd == "check") {
      return View([&](const Timer& t) { out << RenderCheck(t, now) << "\n"; });
    } else if (cmd == "start") {
      return Start();
    } else if (cmd == "stop") {
      return Apply([this](Timer* t) { return wtcore::Stop(t, now); });
    } else if (cmd == "pause") {
      return Pause();
    } else if (cmd == "next") {
      return Apply([this](Timer* t) { return wtcore::Next(t, now); });
    } else if (cmd == "log") {
      return ShowLog(arg1);
    } else if (cmd == "mod") {
      return Mod();
    } else if (cmd == "report") {
      return View(
          [&](const Timer& t) { out << RenderReport(t, now) << "\n"; });
    } else if (cmd == "reset") {
      ResetTimer("Timer reset.", &code);
      return code;
    } else if (cmd == "new") {
      ResetTimer("New timer initialized.", &code);
      return code;
    } else if (cmd == "restart") {
      return Restart();
    } else if (cmd == "remove") {
      return Remove();
    } else if (cmd == "status") {
      return Status();
    } else if (cmd == "mode") {
      return SetMode();
    } else if (cmd == "debug") {
      return Debug();
    } else if (cmd == "help" || cmd == "-h" || cmd == "--help") {
      out << UsageText();
      return 0;
    }
    err << "Unknown command: " << cmd << "\n" << UsageText();
    return 2;
  }
};

CommandRunner::CommandRunner(const Options& opt,
                             wtcore::TimeSource* time_source,
                             std::istream& in, std::ostream& out,
                             std::ostream& err)
    : impl_(new Impl(opt, time_source, in, out, err)) {}

CommandRunner::~CommandRunner() = default;

int CommandRunner::Run(const std::vector<std::string>& args) {
  impl_->now = impl_->time_source->Now();
  impl_->args = args;
  return impl_->Dispatch();
}

std::string UsageText() {
  return "Usage: wt [command] [args]\n"
         "Commands:\n"
         "  start [time]     Start a new cycle or resume a paused one\n"
         "                   (time backdates the first start or shortens\n"
         "                   the previous break)\n"
         "  stop             Stop the running or paused cycle\n"
         "  pause [time]     Pause the running cycle (time adds pause)\n"
         "  next             Stop and immediately start the next cycle\n"
         "  check            Current and total work time (default)\n"
         "  log [info|debug] Timeline of cycles, or the command log\n"
         "  mod ...          Edit the timeline (see `wt mod`)\n"
         "  report           One-line summary of the day\n"
         "  reset, new       Archive the day and start an empty timer\n"
         "  restart [time]   Reset, then start\n"
         "  remove           Delete the timer and its files\n"
         "  status           Print stopped, running or paused\n"
         "  mode [type]      Print or set silent, normal or verbose\n"
         "  debug            Print storage details\n"
         "  help             Show this text\n"
         "Time is 1-4 digits: minutes, or HMM / HHMM.\n";
}

}  // namespace wtcli
