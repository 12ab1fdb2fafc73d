#include <catch2/catch.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/scene_merger.hpp"
#include "test_helpers.hpp"

using namespace shortsmith;
using shortsmith::testing::contiguous_scenes;

TEST_CASE("merge_short_scenes absorbs short scenes forward", "[merger]") {
  auto merged = merge_short_scenes(contiguous_scenes({0.4, 2.6, 3.0}, false),
                                   1.0);
  REQUIRE(merged.size() == 2);
  CHECK(merged[0].start_time() == Approx(0.0));
  CHECK(merged[0].end_time() == Approx(3.0));
  CHECK(merged[1].end_time() == Approx(6.0));
}

TEST_CASE("merge_short_scenes fuses a short tail backward", "[merger]") {
  auto merged = merge_short_scenes(contiguous_scenes({2.0, 3.0, 0.5}, false),
                                   1.0);
  REQUIRE(merged.size() == 2);
  CHECK(merged[1].start_time() == Approx(2.0));
  CHECK(merged[1].end_time() == Approx(5.5));
}

TEST_CASE("merge_short_scenes keeps coverage and speech", "[merger]") {
  auto scenes = contiguous_scenes({0.3, 0.3, 4.0, 0.2, 6.0, 0.1}, true);
  auto merged = merge_short_scenes(scenes, 1.0);

  double speech_before = 0.0;
  for (const auto &s : scenes)
    speech_before += s.speech_duration();
  double speech_after = 0.0;
  for (const auto &s : merged)
    speech_after += s.speech_duration();

  CHECK(merged.front().start_time() == Approx(scenes.front().start_time()));
  CHECK(merged.back().end_time() == Approx(scenes.back().end_time()));
  CHECK(speech_after == Approx(speech_before));
  for (const auto &s : merged)
    CHECK(s.duration() >= 1.0);
}

TEST_CASE("merge_short_scenes is idempotent", "[merger]") {
  auto once = merge_short_scenes(
      contiguous_scenes({0.3, 1.5, 0.2, 0.9, 4.0}, false), 1.0);
  auto twice = merge_short_scenes(once, 1.0);

  REQUIRE(once.size() == twice.size());
  for (size_t i = 0; i < once.size(); ++i) {
    CHECK(once[i].start_time() == Approx(twice[i].start_time()));
    CHECK(once[i].end_time() == Approx(twice[i].end_time()));
  }
}

TEST_CASE("merge_short_scenes keeps a lone short scene", "[merger]") {
  auto merged = merge_short_scenes(contiguous_scenes({0.2}, false), 1.0);
  REQUIRE(merged.size() == 1);
  CHECK(merged[0].duration() == Approx(0.2));

  CHECK(merge_short_scenes({}, 1.0).empty());
}

TEST_CASE("merge_short_scenes rejects invalid sequences", "[merger]") {
  std::vector<Scene> overlapping = {Scene(0.0, 5.0), Scene(4.0, 8.0)};
  CHECK_THROWS_AS(merge_short_scenes(overlapping, 1.0), InvalidInputError);

  std::vector<Scene> backwards = {Scene(0.0, -1.0)};
  CHECK_THROWS_AS(merge_short_scenes(backwards, 1.0), InvalidInputError);

  std::vector<Scene> zero_length = {Scene(0.0, 2.0), Scene(2.0, 2.0)};
  CHECK_THROWS_AS(validate_scenes(zero_length), InvalidInputError);
  CHECK_THROWS_AS(merge_short_scenes(zero_length, 1.0), InvalidInputError);

  std::vector<Scene> gapped = {Scene(0.0, 2.0), Scene(3.0, 5.0)};
  CHECK_NOTHROW(merge_short_scenes(gapped, 1.0));
}
