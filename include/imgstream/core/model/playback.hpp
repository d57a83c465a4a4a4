// File: include/imgstream/core/model/playback.hpp
#pragma once

#include <cstdint>

#include "imgstream/core/config.hpp"
#include "imgstream/core/events/event_sink.hpp"
#include "imgstream/core/io/image_stream.hpp"
#include "imgstream/core/model/playback_runner.hpp"
#include "imgstream/core/status.hpp"

namespace imgstream {

enum class PlaybackStop {
  kEndOfStream,
  kMaxItems,
  kLoadError,
};

struct PlaybackStats {
  std::int64_t read_count{0};
  PlaybackStop stop{PlaybackStop::kEndOfStream};
};

// Plays `stream` into `sink` through a started `runner`.
//
// Event sequence:
//   stream_opened, then image_read (one per decoded item, heartbeat interleaved),
//   then exactly one of input_eof | shutdown (max_items) | load_error.
//
// Returns the loader's status after a load_error, or the first sink error.
// Pixels are released before pacing waits for the next tick.
Status play_stream(const InputConfig& in, ImageStream& stream, PlaybackRunner& runner,
                   EventSink& sink, PlaybackStats& stats);

}  // namespace imgstream
