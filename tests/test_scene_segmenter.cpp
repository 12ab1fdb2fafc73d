#include <algorithm>

#include <catch2/catch.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/scene_segmenter.hpp"

using namespace shortsmith;

namespace {

/// 10 fps, 100 frames, every frame sampled, quiet except at `cuts`
FrameDiffSignal signal_with_cuts(const std::vector<int64_t> &cuts) {
  FrameDiffSignal s;
  s.fps = 10.0;
  s.frame_count = 100;
  for (int64_t f = 1; f < s.frame_count; ++f) {
    bool cut = std::find(cuts.begin(), cuts.end(), f) != cuts.end();
    s.samples.push_back({f, cut ? 0.5 : 0.01});
  }
  return s;
}

} // namespace

TEST_CASE("detect_scenes splits at strong differences", "[segmenter]") {
  SceneSegmenter segmenter(0.5, 27.0);
  auto scenes = segmenter.detect_scenes(signal_with_cuts({30, 70}), {});

  REQUIRE(scenes.size() == 3);
  CHECK(scenes[0].start_time() == Approx(0.0));
  CHECK(scenes[0].end_time() == Approx(3.0));
  CHECK(scenes[1].end_time() == Approx(7.0));
  CHECK(scenes[2].end_time() == Approx(10.0));
}

TEST_CASE("detect_scenes suppresses cuts closer than min_scene_len",
          "[segmenter]") {
  SceneSegmenter segmenter(0.5, 27.0);
  auto scenes = segmenter.detect_scenes(signal_with_cuts({30, 32}), {});

  REQUIRE(scenes.size() == 2);
  CHECK(scenes[0].end_time() == Approx(3.0));
  CHECK(scenes[1].start_time() == Approx(3.0));
}

TEST_CASE("detect_scenes covers the whole video contiguously", "[segmenter]") {
  SceneSegmenter segmenter;
  auto scenes = segmenter.detect_scenes(signal_with_cuts({12, 40, 41, 77}), {});

  REQUIRE_FALSE(scenes.empty());
  CHECK(scenes.front().start_time() == Approx(0.0));
  CHECK(scenes.back().end_time() == Approx(10.0));
  for (size_t i = 1; i < scenes.size(); ++i)
    CHECK(scenes[i].start_time() == Approx(scenes[i - 1].end_time()));
}

TEST_CASE("detect_scenes without cuts yields one scene", "[segmenter]") {
  SceneSegmenter segmenter;
  auto scenes = segmenter.detect_scenes(signal_with_cuts({}), {});
  REQUIRE(scenes.size() == 1);
  CHECK(scenes[0].duration() == Approx(10.0));
}

TEST_CASE("detect_scenes attaches clipped speech", "[segmenter]") {
  SceneSegmenter segmenter;
  auto scenes =
      segmenter.detect_scenes(signal_with_cuts({30}), {{1.0, 4.0}, {9.0, 12.0}});

  REQUIRE(scenes.size() == 2);
  REQUIRE(scenes[0].speech_segments().size() == 1);
  CHECK(scenes[0].speech_segments()[0].end == Approx(3.0));
  CHECK(scenes[0].speech_duration() == Approx(2.0));
  REQUIRE(scenes[1].speech_segments().size() == 2);
  CHECK(scenes[1].speech_segments()[0].start == Approx(3.0));
  CHECK(scenes[1].speech_segments()[1].end == Approx(10.0));
}

TEST_CASE("clip_speech skips spans that only touch the range", "[segmenter]") {
  auto clipped = clip_speech({{0.0, 2.0}, {5.0, 6.0}, {1.0, 3.0}}, 2.0, 5.0);
  REQUIRE(clipped.size() == 1);
  CHECK(clipped[0].start == Approx(2.0));
  CHECK(clipped[0].end == Approx(3.0));
}

TEST_CASE("detect_scenes rejects bad signals", "[segmenter]") {
  SceneSegmenter segmenter;

  FrameDiffSignal no_fps = signal_with_cuts({});
  no_fps.fps = 0.0;
  CHECK_THROWS_AS(segmenter.detect_scenes(no_fps, {}), InvalidInputError);

  FrameDiffSignal unordered;
  unordered.fps = 10.0;
  unordered.frame_count = 50;
  unordered.samples = {{5, 0.0}, {3, 0.0}};
  CHECK_THROWS_AS(segmenter.detect_scenes(unordered, {}), InvalidInputError);

  FrameDiffSignal empty;
  empty.fps = 10.0;
  CHECK(segmenter.detect_scenes(empty, {}).empty());

  /// a sample past the last frame would stretch a scene beyond the video
  FrameDiffSignal overrun = signal_with_cuts({});
  overrun.samples.push_back({105, 0.5});
  CHECK_THROWS_AS(segmenter.detect_scenes(overrun, {}), InvalidInputError);

  FrameDiffSignal at_count = signal_with_cuts({});
  at_count.samples.push_back({100, 0.5});
  CHECK_THROWS_AS(segmenter.detect_scenes(at_count, {}), InvalidInputError);
}

TEST_CASE("clip_speech drops spans touching a scene edge for break detection",
          "[segmenter]") {
  SceneSegmenter segmenter;
  /// speech ends exactly on the cut at 3.0s, so the second scene is silent
  auto scenes = segmenter.detect_scenes(signal_with_cuts({30}), {{1.0, 3.0}});
  REQUIRE(scenes.size() == 2);
  CHECK(scenes[0].has_speech());
  CHECK_FALSE(scenes[1].has_speech());
}
