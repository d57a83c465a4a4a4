// File: src/core/events/jsonl_event_sink.cpp
#include "imgstream/core/events/jsonl_event_sink.hpp"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

namespace imgstream {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

std::string quoted(std::string_view s) { return "\"" + json_escape(s) + "\""; }

}  // namespace

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char ch : s) {
    switch (ch) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
          out += buf;
        } else {
          out += ch;
        }
    }
  }
  return out;
}

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  path_ = join_path(run.out_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":" << t0 << ","
     << "\"t_s\":" << ns_to_s(t0) << ","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"run_id\":" << quoted(run.run_id) << ","
     << "\"config_path\":" << quoted(run.config_path) << ","
     << "\"config_hash\":" << quoted(run.config_hash)
     << "}";

  const Status w = write_line_(ss.str());
  if (!w.ok()) return w;
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");

  const std::int64_t t = e.t_ns.ns;
  const std::int64_t tw = e.t_wall_ns.ns;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":" << quoted(e.type) << ","
     << "\"t_ns\":" << t << ","
     << "\"t_s\":" << ns_to_s(t) << ","
     << "\"t_wall_ns\":" << tw << ","
     << "\"t_wall_s\":" << ns_to_s(tw);

  for (const auto& f : e.fields) {
    ss << "," << quoted(f.key) << ":";
    if (f.is_number) ss << f.value;
    else ss << quoted(f.value);
  }

  if (!e.message.empty()) {
    ss << ",\"message\":" << quoted(e.message);
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace imgstream
