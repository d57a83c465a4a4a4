// File: src/core/model/playback.cpp
#include "imgstream/core/model/playback.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace imgstream {

Status play_stream(const InputConfig& in, ImageStream& stream, PlaybackRunner& runner,
                   EventSink& sink, PlaybackStats& stats) {
  stats = PlaybackStats{};

  IMGSTREAM_RETURN_IF_ERROR(stream.open());
  stream.seek(in.start_index, SeekOrigin::kBegin);

  {
    Event e;
    e.type = "stream_opened";
    e.add("dir", in.dir).add("length", stream.length()).add("position", stream.position());
    IMGSTREAM_RETURN_IF_ERROR(runner.emit(sink, std::move(e)));
  }

  using clock = std::chrono::steady_clock;

  const bool paced = in.tick_hz > 0.0;
  const auto tick_period = paced ? std::chrono::duration_cast<std::chrono::nanoseconds>(
                                       std::chrono::duration<double>(1.0 / in.tick_hz))
                                 : std::chrono::nanoseconds(0);

  const auto t_start = clock::now();
  auto next_tick = t_start + tick_period;
  auto last_hb = t_start;

  while (true) {
    const auto now = clock::now();

    if (in.max_items > 0 && stats.read_count >= in.max_items) {
      stats.stop = PlaybackStop::kMaxItems;
      return runner.emit_event(sink, "shutdown", "max_items reached");
    }

    if (in.heartbeat_every_s > 0 && now - last_hb >= std::chrono::seconds(in.heartbeat_every_s)) {
      last_hb = now;
      IMGSTREAM_RETURN_IF_ERROR(
          runner.emit_heartbeat(sink, "alive read=" + std::to_string(stats.read_count)));
    }

    const std::int64_t index = stream.position();
    const std::optional<std::string> path = stream.current_path();

    auto img_r = stream.read();
    if (!img_r.ok()) {
      stats.stop = PlaybackStop::kLoadError;
      Event e;
      e.type = "load_error";
      e.message = img_r.status().message();
      e.add("index", index).add("path", path.value_or(""));
      IMGSTREAM_RETURN_IF_ERROR(runner.emit(sink, std::move(e)));
      return img_r.status();
    }

    std::optional<Image> img = img_r.take_value();
    if (!img) {
      stats.stop = PlaybackStop::kEndOfStream;
      return runner.emit_event(sink, "input_eof", "input stream reached end");
    }

    Event e;
    e.type = "image_read";
    e.add("index", index)
        .add("path", path.value_or(""))
        .add("width", static_cast<std::int64_t>(img->width()))
        .add("height", static_cast<std::int64_t>(img->height()))
        .add("channels", static_cast<std::int64_t>(img->channels()));
    img.reset();

    IMGSTREAM_RETURN_IF_ERROR(runner.emit(sink, std::move(e)));
    IMGSTREAM_RETURN_IF_ERROR(sink.flush());

    ++stats.read_count;

    if (paced) {
      const auto after = clock::now();
      if (after < next_tick) {
        std::this_thread::sleep_until(next_tick);
        next_tick += tick_period;
      } else {
        next_tick = after + tick_period;
      }
    }
  }
}

}  // namespace imgstream
