// Copyright (c) 2025 <Your Name>
#include "wtcli/options.hpp"

#include <cstdlib>
#include <utility>

namespace wtcli {

Options::Builder::Builder() : skip_prompts_(false) {}

Options::Builder::Builder(const Options& base)
    : root_(base.Root()),
      fixed_now_(base.FixedNow()),
      report_file_(base.ReportFile()),
      skip_prompts_(base.SkipPrompts()),
      log_sink_cb_(base.LogSink()) {}

Options::Builder& Options::Builder::Root(std::string v) {
  root_ = std::move(v);
  return *this;
}

Options::Builder& Options::Builder::FixedNow(
    std::optional<wtcore::Timestamp> v) {
  fixed_now_ = v;
  return *this;
}

Options::Builder& Options::Builder::ReportFile(std::string v) {
  report_file_ = std::move(v);
  return *this;
}

Options::Builder& Options::Builder::SkipPrompts(bool v) {
  skip_prompts_ = v;
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  return Options(root_, fixed_now_, report_file_, skip_prompts_,
                 log_sink_cb_);
}

Options::Options() : skip_prompts_(false) {}

Options::Options(std::string root, std::optional<wtcore::Timestamp> fixed_now,
                 std::string report_file, bool skip_prompts,
                 LogCallback log_cb)
    : root_(std::move(root)),
      fixed_now_(fixed_now),
      report_file_(std::move(report_file)),
      skip_prompts_(skip_prompts),
      log_callback_(std::move(log_cb)) {}

bool Options::FromEnvironment(Options* out, std::string* err,
                              const EnvLookup& lookup) {
  auto get = [&lookup](const char* name) -> std::string {
    const char* v = lookup ? lookup(name) : std::getenv(name);
    return v ? std::string(v) : std::string();
  };

  const std::string root = get("WT_ROOT");
  if (root.empty()) {
    if (err) *err = "Env $WT_ROOT not set.";
    return false;
  }

  Builder b;
  b.Root(root).ReportFile(get("WT_REPORT_FILE"));
  b.SkipPrompts(!get("WT_SKIP_PROMPTS").empty());

  // An unparsable mock time falls back to the real clock.
  wtcore::Timestamp mock;
  if (wtcore::Timestamp::Parse(get("WT_MOCK_TIME"), &mock)) {
    b.FixedNow(mock);
  }

  *out = b.Build();
  return true;
}

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "root=" << o.Root() << ", now="
     << (o.FixedNow() ? o.FixedNow()->ToString() : std::string("clock"))
     << ", report_file="
     << (o.ReportFile().empty() ? std::string("default") : o.ReportFile())
     << ", skip_prompts=" << (o.SkipPrompts() ? "true" : "false");
  return os;
}

}  // namespace wtcli
