// File: src/apps/imgstream_play/main.cpp
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "imgstream/adapters/image_dir/image_dir_reader.hpp"
#include "imgstream/core/events/jsonl_event_sink.hpp"
#include "imgstream/core/model/playback.hpp"
#include "imgstream/core/model/playback_runner.hpp"
#include "imgstream/core/util/config_loader.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "imgstream_play\n"
            << "  --config <path>\n";
}

imgstream::ImageDirectoryReaderConfig reader_config_from(const imgstream::Config& cfg) {
  imgstream::ImageDirectoryReaderConfig rc;
  rc.dir = cfg.input.dir;
  rc.patterns = cfg.input.patterns;
  rc.natural_sort = cfg.input.natural_sort;
  rc.recursive = cfg.input.recursive;
  return rc;
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = imgstream::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const imgstream::Config cfg = cfg_r.take_value();

  imgstream::PlaybackRunner runner(cfg, args.config_path);
  imgstream::JsonlEventSink sink;

  const imgstream::Status st_start = runner.start(sink);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  auto reader_r = imgstream::ImageDirectoryReader::create(reader_config_from(cfg));
  if (!reader_r.ok()) {
    std::cerr << reader_r.status().message() << "\n";
    (void)runner.emit_event(sink, "input_error", reader_r.status().message());
    runner.stop(sink);
    return 2;
  }
  std::unique_ptr<imgstream::ImageDirectoryReader> reader = reader_r.take_value();

  // Ensure we always close/flush cleanly.
  struct Guard {
    imgstream::PlaybackRunner& r;
    imgstream::JsonlEventSink& s;
    imgstream::ImageStream& src;
    ~Guard() {
      src.close();
      r.stop(s);
    }
  } guard{runner, sink, *reader};

  std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  std::cout << "Input: " << cfg.input.dir << "  items=" << reader->length()
            << "  start=" << cfg.input.start_index << "  tick_hz=" << cfg.input.tick_hz << "\n\n";

  imgstream::PlaybackStats stats;
  const imgstream::Status st = imgstream::play_stream(cfg.input, *reader, runner, sink, stats);
  if (!st.ok()) {
    std::cerr << st.message() << "\n";
    return 2;
  }

  std::cout << "OK (" << stats.read_count << " images)\n";
  return 0;
}
