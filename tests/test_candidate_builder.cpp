#include <catch2/catch.hpp>

#include "shortsmith/candidate_builder.hpp"
#include "shortsmith/errors.hpp"
#include "shortsmith/highlight_selector.hpp"
#include "test_helpers.hpp"

using namespace shortsmith;
using shortsmith::testing::contiguous_scenes;
using shortsmith::testing::words_every_second;

TEST_CASE("adaptive_max_duration stretches with density and richness",
          "[candidates]") {
  CHECK(adaptive_max_duration(30, 90, 0.0, 0.0) == Approx(30.0));
  CHECK(adaptive_max_duration(30, 90, 1.0, 1.0) == Approx(90.0));
  CHECK(adaptive_max_duration(30, 90, 1.0, 0.2) == Approx(66.0));
}

TEST_CASE("text_in_range keeps only fully contained words", "[candidates]") {
  std::vector<Word> words = {{"one", 0.0, 0.5, {}},
                             {"two", 1.0, 1.5, {}},
                             {"", 1.6, 1.7, {}},
                             {"three", 1.8, 2.5, {}}};
  CHECK(text_in_range(words, 0.0, 2.0) == "one two");
  CHECK(text_in_range(words, 0.5, 3.0) == "two three");
  CHECK(text_in_range(words, 5.0, 6.0).empty());
}

TEST_CASE("a short silent video yields no candidates", "[candidates]") {
  EngineConfig config;
  auto scenes = contiguous_scenes({10.0}, false);

  CHECK(build_candidates(scenes, {}, config).empty());

  HighlightSelector selector(config);
  CHECK(selector.select(scenes, {}).empty());
}

TEST_CASE("speech-covered scenes produce a viable highlight", "[candidates]") {
  EngineConfig config;
  auto scenes = contiguous_scenes({20, 20, 20, 20, 20}, true);
  auto words = words_every_second(0.0, 100.0, "talk");

  auto groups = build_candidates(scenes, words, config);
  REQUIRE_FALSE(groups.empty());
  bool in_band = false;
  for (const auto &g : groups) {
    if (g.duration() >= 30.0 && g.duration() <= 90.0)
      in_band = true;
  }
  CHECK(in_band);

  /// i=0, j=1 is widened to scenes [0, 2] and padded right by 5s
  CHECK(groups.front().first_scene == 0);
  CHECK(groups.front().last_scene == 2);
  CHECK(groups.front().start_time == Approx(0.0));
  CHECK(groups.front().end_time == Approx(65.0));
  CHECK(groups.front().generation_index == 0);

  HighlightSelector selector(config);
  auto highlights = selector.select(scenes, words);
  REQUIRE_FALSE(highlights.empty());
  CHECK_FALSE(highlights.front().text.empty());
}

TEST_CASE("legacy right pad leaves the window end unpadded", "[candidates]") {
  EngineConfig config;
  config.legacy_right_pad = true;
  auto scenes = contiguous_scenes({20, 20, 20, 20, 20}, true);

  auto groups = build_candidates(scenes, {}, config);
  REQUIRE_FALSE(groups.empty());
  CHECK(groups.front().end_time == Approx(60.0));
}

TEST_CASE("padding is clamped to the video range", "[candidates]") {
  EngineConfig config;
  auto scenes = contiguous_scenes({20, 20, 20, 20, 20}, true);

  for (const auto &g : build_candidates(scenes, {}, config)) {
    CHECK(g.start_time >= 0.0);
    CHECK(g.end_time <= 100.0);
    CHECK(g.start_time < g.end_time);
  }
}

TEST_CASE("a silent scene before speech is a natural break", "[candidates]") {
  EngineConfig config;
  config.min_duration = 30.0;
  config.max_duration = 31.0;

  std::vector<Scene> with_break = {Scene(0, 20, {{0, 20}}), Scene(20, 32),
                                   Scene(32, 50, {{32, 50}})};
  std::vector<Scene> without_break = {Scene(0, 20, {{0, 20}}),
                                      Scene(20, 32, {{20, 32}}),
                                      Scene(32, 50, {{32, 50}})};

  CHECK(build_candidates(with_break, {}, config).size() == 2);
  CHECK(build_candidates(without_break, {}, config).size() == 1);
}

TEST_CASE("build_candidates validates its inputs", "[candidates]") {
  EngineConfig config;
  config.min_duration = 60.0;
  config.max_duration = 30.0;
  CHECK_THROWS_AS(build_candidates(contiguous_scenes({10}, false), {}, config),
                  InvalidInputError);

  EngineConfig ok;
  std::vector<Scene> overlapping = {Scene(0, 10), Scene(5, 20)};
  CHECK_THROWS_AS(build_candidates(overlapping, {}, ok), InvalidInputError);
}
