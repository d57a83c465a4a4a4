// include/imgstream/core/config.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "imgstream/core/status.hpp"
#include "imgstream/core/types.hpp"

namespace imgstream {

// -----------------------------
// Input: image directory stream
// -----------------------------
struct InputConfig {
  // Root directory holding the image files.
  std::string dir;

  // File name wildcards; a file matching any of them is part of the stream.
  std::vector<std::string> patterns{"*.png", "*.jpg", "*.jpeg", "*.bmp", "*.tif", "*.tiff"};

  // Natural order ("img2" before "img10"); false keeps raw directory order.
  bool natural_sort = true;

  // Descend into subdirectories.
  bool recursive = false;

  // Seek target (from the beginning) applied right after open. Clamped by the stream.
  std::int64_t start_index = 0;

  // Stop after this many images (0 disables).
  std::int64_t max_items = 0;

  // Playback pacing. 0 = as fast as the loader allows.
  double tick_hz = 0.0;

  // Emit a heartbeat event every N seconds (0 disables).
  int heartbeat_every_s = 5;
};

// -----------------------------
// Output (events)
// -----------------------------
struct OutputConfig {
  // Where to write event JSONL files.
  std::string out_dir = "out";

  // How many per-run event files to keep in out_dir.
  int keep_runs = 50;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  RunId run_id = "run_001";
  InputConfig input;
  OutputConfig output;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.run_id.empty()) {
    return Status::invalid_argument("run_id must not be empty");
  }
  if (cfg.input.dir.empty()) {
    return Status::invalid_argument("input.dir must not be empty");
  }
  if (cfg.input.patterns.empty()) {
    return Status::invalid_argument("input.patterns must list at least one pattern");
  }
  for (const auto& p : cfg.input.patterns) {
    if (p.empty()) return Status::invalid_argument("input.patterns must not contain empty patterns");
  }
  if (cfg.input.start_index < 0) {
    return Status::invalid_argument("input.start_index must be >= 0");
  }
  if (cfg.input.max_items < 0) {
    return Status::invalid_argument("input.max_items must be >= 0");
  }
  if (cfg.input.tick_hz < 0.0) {
    return Status::invalid_argument("input.tick_hz must be >= 0");
  }
  if (cfg.input.heartbeat_every_s < 0) {
    return Status::invalid_argument("input.heartbeat_every_s must be >= 0");
  }
  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.keep_runs <= 0) {
    return Status::invalid_argument("output.keep_runs must be > 0");
  }
  return Status::ok_status();
}

}  // namespace imgstream
