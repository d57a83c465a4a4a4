// File: include/imgstream/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "imgstream/core/status.hpp"
#include "imgstream/core/types.hpp"

namespace imgstream {

// Minimal event model.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  RunId run_id;
  std::string config_path;
  std::string out_dir;
  std::string config_hash;

  TimestampNs start_time_ns;       // relative, always 0
  TimestampNs wall_start_time_ns;  // absolute epoch
};

struct EventField {
  std::string key;
  std::string value;
  bool is_number{false};  // emitted unquoted
};

struct Event {
  std::string type;  // e.g. "run_started", "heartbeat", "image_read"
  TimestampNs t_ns;
  TimestampNs t_wall_ns;

  std::string message;  // optional human-readable hint
  std::vector<EventField> fields;

  Event& add(std::string key, std::string value) {
    fields.push_back(EventField{std::move(key), std::move(value), false});
    return *this;
  }
  Event& add(std::string key, std::int64_t value) {
    fields.push_back(EventField{std::move(key), std::to_string(value), true});
    return *this;
  }
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace imgstream
