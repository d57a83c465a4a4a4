// File: include/imgstream/core/model/playback_runner.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "imgstream/core/config.hpp"
#include "imgstream/core/events/event_sink.hpp"
#include "imgstream/core/status.hpp"
#include "imgstream/core/types.hpp"  // TimestampNs

namespace imgstream {

// PlaybackRunner owns run lifecycle (start -> events -> stop).
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns at emission time
class PlaybackRunner {
 public:
  PlaybackRunner(Config cfg, std::string config_path);

  Status start(EventSink& sink);

  Status emit_heartbeat(EventSink& sink, const std::string& message);
  Status emit_event(EventSink& sink, const std::string& type, const std::string& message);

  // Stamps `e` with run-relative and wall time, then emits it.
  Status emit(EventSink& sink, Event e);

  void stop(EventSink& sink);

  [[nodiscard]] bool started() const noexcept { return started_; }

  // Deletes all but the newest `keep_last` events_<ns>.jsonl files in `out_dir`.
  // events_latest.jsonl and unrelated files are never touched.
  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

 private:
  static TimestampNs wall_now_epoch_ns();
  TimestampNs since_start_ns() const;

  Config cfg_;
  std::string config_path_;

  std::chrono::steady_clock::time_point t0_steady_{};
  TimestampNs t0_wall_ns_{0};
  bool started_{false};
};

}  // namespace imgstream
