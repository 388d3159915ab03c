// Copyright (c) 2025 <Your Name>
#include "wtcli/timer_store.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "wtcli/timer_codec.hpp"

namespace fs = std::filesystem;

namespace wtcli {

using wtcore::ErrorCode;
using wtcore::Outcome;

namespace {

constexpr const char* kOutputFolder = ".out";
constexpr const char* kDataFile = "wt.json";
constexpr const char* kDebugLogFile = "debug-log";
constexpr const char* kReportFile = "daily-reports";

Outcome IoError(const std::string& what, const fs::path& p) {
  return Outcome::Fail(ErrorCode::kIo, what + " " + p.string());
}

// Reads the whole file; nullopt when it cannot be opened.
std::optional<std::string> ReadFile(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool WriteFile(const fs::path& p, const std::string& content,
               std::ios::openmode extra = std::ios::trunc) {
  std::ofstream f(p, std::ios::binary | std::ios::out | extra);
  if (!f) return false;
  f << content;
  return static_cast<bool>(f);
}

}  // namespace

struct TimerStore::Impl {
  fs::path out_dir;
  fs::path data_file;
  fs::path debug_file;
  fs::path report_file;

  Outcome EnsureOutputDir() const {
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) return IoError("Cannot create", out_dir);
    return Outcome::Applied("");
  }
};

TimerStore::TimerStore(const Options& opt) : impl_(new Impl) {
  impl_->out_dir = fs::path(opt.Root()) / kOutputFolder;
  impl_->data_file = impl_->out_dir / kDataFile;
  impl_->debug_file = impl_->out_dir / kDebugLogFile;
  impl_->report_file = opt.ReportFile().empty()
                           ? impl_->out_dir / kReportFile
                           : fs::path(opt.ReportFile());
}

TimerStore::~TimerStore() = default;

std::string TimerStore::OutputDir() const { return impl_->out_dir.string(); }
std::string TimerStore::DataFile() const { return impl_->data_file.string(); }
std::string TimerStore::DebugLogFile() const {
  return impl_->debug_file.string();
}
std::string TimerStore::ReportFile() const {
  return impl_->report_file.string();
}

bool TimerStore::Exists() const {
  std::error_code ec;
  return fs::is_regular_file(impl_->data_file, ec);
}

Outcome TimerStore::Load(wtcore::Timer* out) const {
  if (!Exists()) return Outcome::Fail(ErrorCode::kNotFound, "No timer exists.");
  std::optional<std::string> text = ReadFile(impl_->data_file);
  if (!text) return IoError("Cannot read", impl_->data_file);

  wtcore::Timer t;
  std::string err;
  if (!TimerCodec::Parse(*text, &t, &err)) {
    return Outcome::Fail(ErrorCode::kIo, err);
  }
  *out = std::move(t);
  return Outcome::Applied("");
}

Outcome TimerStore::Save(const wtcore::Timer& t) const {
  Outcome dir = impl_->EnsureOutputDir();
  if (!dir.ok()) return dir;
  if (!WriteFile(impl_->data_file, TimerCodec::Serialize(t))) {
    return IoError("Cannot write", impl_->data_file);
  }
  return Outcome::Applied("");
}

Outcome TimerStore::ResetFiles() const {
  const std::optional<std::string> report = ReadFile(impl_->report_file);

  std::error_code ec;
  fs::remove_all(impl_->out_dir, ec);
  if (ec) return IoError("Cannot remove", impl_->out_dir);
  Outcome dir = impl_->EnsureOutputDir();
  if (!dir.ok()) return dir;

  if (!WriteFile(impl_->debug_file, "")) {
    return IoError("Cannot write", impl_->debug_file);
  }
  if (report && !WriteFile(impl_->report_file, *report)) {
    return IoError("Cannot write", impl_->report_file);
  }
  return Outcome::Applied("");
}

Outcome TimerStore::Remove() const {
  for (const fs::path* p :
       {&impl_->data_file, &impl_->debug_file, &impl_->report_file}) {
    std::error_code ec;
    fs::remove(*p, ec);
    if (ec) return IoError("Cannot remove", *p);
  }
  return Outcome::Applied("");
}

Outcome TimerStore::AppendDebug(const std::string& line) const {
  Outcome dir = impl_->EnsureOutputDir();
  if (!dir.ok()) return dir;
  if (!WriteFile(impl_->debug_file, line + "\n", std::ios::app)) {
    return IoError("Cannot write", impl_->debug_file);
  }
  return Outcome::Applied("");
}

Outcome TimerStore::ReadDebug(std::string* out) const {
  std::optional<std::string> text = ReadFile(impl_->debug_file);
  if (!text) return IoError("Cannot read", impl_->debug_file);
  *out = std::move(*text);
  return Outcome::Applied("");
}

Outcome TimerStore::PrependReport(const std::string& line) const {
  const std::string existing = ReadFile(impl_->report_file).value_or("");
  if (impl_->report_file.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(impl_->report_file.parent_path(), ec);
    if (ec) return IoError("Cannot create", impl_->report_file.parent_path());
  }
  if (!WriteFile(impl_->report_file, line + "\n" + existing)) {
    return IoError("Cannot write", impl_->report_file);
  }
  return Outcome::Applied("");
}

}  // namespace wtcli
