#include "test_config.hpp"

#include "imgstream/core/events/jsonl_event_sink.hpp"
#include "imgstream/core/model/playback.hpp"
#include "imgstream/core/model/playback_runner.hpp"

#include <vector>

namespace imgstream::test {

namespace {

std::vector<std::string> event_types(const std::vector<std::string>& lines)
{
  std::vector<std::string> types;
  const std::string key = "\"type\":\"";
  for (const auto& line : lines) {
    const auto at = line.find(key);
    if (at == std::string::npos) continue;
    const auto begin = at + key.size();
    types.push_back(line.substr(begin, line.find('"', begin) - begin));
  }
  return types;
}

}  // namespace

class PlaybackTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    dir.touch("frames/img1.png");
    dir.touch("frames/img2.png");
    dir.touch("frames/img10.png");

    cfg.run_id = "playback";
    cfg.input.dir = (dir.path() / "frames").string();
    cfg.input.patterns = {"*.png"};
    cfg.input.heartbeat_every_s = 0;
    cfg.output.out_dir = (dir.path() / "events").string();
  }

  // Runs a whole playback and returns the recorded event lines.
  std::vector<std::string> play(ImageLoader loader = path_echo_loader)
  {
    auto reader_r = ImageDirectoryReader::create(cfg.input.dir, cfg.input.patterns, true, false,
                                                 std::move(loader));
    EXPECT_TRUE(reader_r.ok()) << reader_r.status().message();
    auto reader = reader_r.take_value();

    PlaybackRunner runner(cfg, "play.yaml");
    JsonlEventSink sink;
    EXPECT_TRUE(runner.start(sink).ok());
    const std::string events = sink.path();

    status = play_stream(cfg.input, *reader, runner, sink, stats);
    runner.stop(sink);
    return read_lines(events);
  }

  TempDir dir;
  Config cfg;
  PlaybackStats stats;
  Status status;
};

TEST_F(PlaybackTest, ReadsEverythingThenReportsEof)
{
  const auto lines = play();
  ASSERT_TRUE(status.ok()) << status.message();
  EXPECT_EQ(stats.read_count, 3);
  EXPECT_EQ(stats.stop, PlaybackStop::kEndOfStream);

  EXPECT_EQ(event_types(lines),
            (std::vector<std::string>{"run_started", "stream_opened", "image_read", "image_read",
                                      "image_read", "input_eof"}));
  EXPECT_TRUE(contains(lines[1], "\"length\":3"));
  EXPECT_TRUE(contains(lines[2], "img1.png"));
  EXPECT_TRUE(contains(lines[3], "img2.png"));
  EXPECT_TRUE(contains(lines[4], "img10.png"));
  EXPECT_TRUE(contains(lines[4], "\"index\":2"));
}

TEST_F(PlaybackTest, MaxItemsStopsWithShutdown)
{
  cfg.input.max_items = 2;
  const auto lines = play();
  ASSERT_TRUE(status.ok()) << status.message();
  EXPECT_EQ(stats.read_count, 2);
  EXPECT_EQ(stats.stop, PlaybackStop::kMaxItems);

  EXPECT_EQ(event_types(lines),
            (std::vector<std::string>{"run_started", "stream_opened", "image_read", "image_read",
                                      "shutdown"}));
}

TEST_F(PlaybackTest, StartIndexSeeksBeforeFirstRead)
{
  cfg.input.start_index = 2;
  const auto lines = play();
  ASSERT_TRUE(status.ok());
  EXPECT_EQ(stats.read_count, 1);

  ASSERT_EQ(event_types(lines).size(), 4u);
  EXPECT_TRUE(contains(lines[1], "\"position\":2"));
  EXPECT_TRUE(contains(lines[2], "img10.png"));
}

TEST_F(PlaybackTest, LoadFailureEmitsLoadErrorAndReturnsStatus)
{
  ImageLoader failing_second = [](const std::string& path) {
    if (fs::path(path).filename() == "img2.png") {
      return Result<Image>::err(Status::corrupt_data("bad pixels"));
    }
    return path_echo_loader(path);
  };

  const auto lines = play(failing_second);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.code(), Status::Code::kCorruptData);
  EXPECT_EQ(stats.read_count, 1);
  EXPECT_EQ(stats.stop, PlaybackStop::kLoadError);

  EXPECT_EQ(event_types(lines),
            (std::vector<std::string>{"run_started", "stream_opened", "image_read", "load_error"}));
  EXPECT_TRUE(contains(lines[3], "\"index\":1"));
  EXPECT_TRUE(contains(lines[3], "img2.png"));
  EXPECT_TRUE(contains(lines[3], "bad pixels"));
}

}  // namespace imgstream::test
