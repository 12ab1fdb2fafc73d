#include <filesystem>
#include <fstream>
#include <sstream>

#include <catch2/catch.hpp>

#include "shortsmith/clip_renderer.hpp"
#include "shortsmith/errors.hpp"

using namespace shortsmith;

TEST_CASE("target_height_for follows the aspect ratio", "[render]") {
  CHECK(target_height_for("9:16", 1080) == 1920);
  CHECK(target_height_for("1:1", 720) == 720);
  CHECK(target_height_for("4:5", 1080) == 1350);
  CHECK_THROWS_AS(target_height_for("916", 1080), InvalidInputError);
  CHECK_THROWS_AS(target_height_for("a:b", 1080), InvalidInputError);
  CHECK_THROWS_AS(target_height_for("0:16", 1080), InvalidInputError);
}

TEST_CASE("generate_title strips punctuation and shortens", "[render]") {
  CHECK(generate_title("Hello, world!") == "HELLO WORLD");
  CHECK(generate_title("This is a much longer sentence about pasta.") ==
        "THIS IS A MUCH LONGER...");
  CHECK(generate_title("Supercalifragilisticexpialidocious indeed") ==
        "SUPERCALIFRAGILISTICEXPIALIDOCIOUS INDEED");
}

TEST_CASE("caption_text uses the opening words or a stock line", "[render]") {
  CHECK(caption_text("", 0) == "Watch this amazing highlight!");
  CHECK(caption_text("too short", 6) == "Don't miss this key moment!");
  CHECK(caption_text("only four words here", 0) == "only four words here");
  CHECK(caption_text("one two three four five six seven eight nine ten "
                     "eleven twelve thirteen",
                     0) ==
        "one two three four five six seven eight nine ten eleven twelve...");
}

TEST_CASE("sanitize_overlay_text removes drawtext metacharacters",
          "[render]") {
  CHECK(sanitize_overlay_text("Don't: \"stop\", 100%\\") == "Dont stop 100");
}

TEST_CASE("build_captions wraps lines at forty characters", "[render]") {
  std::vector<Word> words;
  for (int i = 0; i < 5; ++i)
    words.push_back({"abcdefghi", 10.0 + i, 10.5 + i, {}});

  auto captions = build_captions(words, 10.0);
  REQUIRE(captions.size() == 2);
  CHECK(captions[0].text == "abcdefghi abcdefghi abcdefghi abcdefghi");
  CHECK(captions[0].start == Approx(0.0));
  CHECK(captions[0].end == Approx(4.0));
  CHECK(captions[1].text == "abcdefghi");
  CHECK(captions[1].start == Approx(4.0));
  CHECK(captions[1].end == Approx(4.5));

  CHECK(build_captions({}, 0.0).empty());
}

TEST_CASE("SRT timestamps and file layout", "[render]") {
  CHECK(format_srt_time(0.25) == "00:00:00,250");
  CHECK(format_srt_time(3661.5) == "01:01:01,500");
  CHECK(format_srt_time(-3.0) == "00:00:00,000");

  std::vector<Caption> captions = {{0.0, 1.5, "first line"},
                                   {1.5, 3.0, "second line"}};
  CHECK(format_srt(captions) == "1\n00:00:00,000 --> 00:00:01,500\nfirst line\n\n"
                                "2\n00:00:01,500 --> 00:00:03,000\nsecond line\n\n");

  namespace fs = std::filesystem;
  fs::path path = fs::temp_directory_path() / "shortsmith_render_test.srt";
  REQUIRE(write_srt(path.string(), captions));
  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  CHECK(content.str() == format_srt(captions));
  fs::remove(path);
}

TEST_CASE("vertical filter with and without overlays", "[render]") {
  RenderOptions options;
  options.target_width = 1080;
  options.target_height = 1920;

  auto plain = build_vertical_filter(options, "TITLE", "caption", false);
  CHECK(plain == "scale=1080:1920:force_original_aspect_ratio=decrease,"
                 "pad=1080:1920:(ow-iw)/2:(oh-ih)/2");

  auto full = build_vertical_filter(options, "TITLE", "caption", true);
  CHECK(full.rfind(plain, 0) == 0);
  CHECK(full.find("drawtext=text='TITLE':fontsize=48") != std::string::npos);
  CHECK(full.find("drawtext=text='caption':fontsize=36") != std::string::npos);
}
