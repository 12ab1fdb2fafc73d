#include <catch2/catch.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/external_tools.hpp"
#include "shortsmith/frame_diff_scanner.hpp"
#include "shortsmith/task_queue.hpp"

using namespace shortsmith;

TEST_CASE("sample_step converts a sampling rate into a frame stride",
          "[scan]") {
  CHECK(sample_step(30.0, 1.0) == 30);
  CHECK(sample_step(29.97, 1.0) == 29);
  CHECK(sample_step(25.0, 50.0) == 1);
  CHECK(sample_step(30.0, 0.0) == 1);
}

TEST_CASE("mean_abs_diff is normalized to [0,1]", "[scan]") {
  std::vector<uint8_t> black(100, 0);
  std::vector<uint8_t> white(100, 255);
  std::vector<uint8_t> half(100, 0);
  for (size_t i = 0; i < 50; ++i)
    half[i] = 255;

  CHECK(mean_abs_diff(black, black) == Approx(0.0));
  CHECK(mean_abs_diff(black, white) == Approx(1.0));
  CHECK(mean_abs_diff(white, half) == Approx(0.5));
  CHECK(mean_abs_diff({}, {}) == Approx(0.0));
}

TEST_CASE("TaskQueue drains then reports completion", "[scan]") {
  TaskQueue queue;
  queue.push({0, 10, 0});
  queue.push({10, 20, 1});
  queue.finish();

  ScanTask task;
  REQUIRE(queue.pop(task));
  CHECK(task.id == 0);
  REQUIRE(queue.pop(task));
  CHECK(task.first_sample == 10);
  CHECK_FALSE(queue.pop(task));
}

TEST_CASE("ResultCollector returns samples in frame order", "[scan]") {
  ResultCollector results;
  results.add({{60, 0.2}, {90, 0.3}});
  results.add({{0, 0.0}, {30, 0.1}});

  auto samples = results.extract();
  REQUIRE(samples.size() == 4);
  for (size_t i = 0; i < samples.size(); ++i)
    CHECK(samples[i].frame_index == static_cast<int64_t>(i * 30));
}

TEST_CASE("a missing file is a media error", "[scan]") {
  CHECK_THROWS_AS(
      scan_frame_differences("/nonexistent/shortsmith.mp4", 1.0, 1, 60.0),
      MediaError);
}

TEST_CASE("tool command lines quote their arguments", "[tools]") {
  auto dl = build_download_command("https://example.com/v?id=1", "out dir/in.mp4",
                                   "cookies.txt");
  CHECK(dl.find("--cookies 'cookies.txt'") != std::string::npos);
  CHECK(dl.find("-o 'out dir/in.mp4' 'https://example.com/v?id=1'") !=
        std::string::npos);
  CHECK(build_download_command("u", "o", "").find("--cookies") ==
        std::string::npos);

  auto whisper = build_whisper_command("clip.mp4", "/tmp/t", "base", "en");
  CHECK(whisper.find("--word_timestamps True") != std::string::npos);
  CHECK(whisper.find("--output_format json") != std::string::npos);
  CHECK(whisper.find("--language 'en'") != std::string::npos);
  CHECK(build_whisper_command("a", "b", "base", "").find("--language") ==
        std::string::npos);
}

TEST_CASE("acquire_video keeps existing local files", "[tools]") {
  CHECK(acquire_video(__FILE__, "unused.mp4", "") == __FILE__);
}
