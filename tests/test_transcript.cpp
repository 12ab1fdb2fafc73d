#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/transcript.hpp"

using namespace shortsmith;

namespace {

const char *const WHISPER_JSON = R"({
  "language": "en",
  "text": "Hello there. General Kenobi.",
  "segments": [
    {"id": 0, "start": 0.0, "end": 2.0, "text": " Hello there.",
     "words": [
       {"word": " Hello", "start": 0.0, "end": 0.6, "probability": 0.9},
       {"word": " there.", "start": 0.7, "end": 1.2, "probability": 0.8},
       {"word": " um", "start": 1.3, "end": 1.3}
     ]},
    {"id": 1, "start": 2.0, "end": 2.5, "text": "   "},
    {"id": 2, "start": 2.5, "end": 4.0, "text": " General Kenobi."}
  ]
})";

Transcript segments_at(const std::vector<std::pair<double, double>> &times) {
  Transcript t;
  for (const auto &p : times)
    t.segments.push_back({p.first, p.second, "x", {}});
  return t;
}

} // namespace

TEST_CASE("parse_whisper_json reads segments and words", "[transcript]") {
  Transcript t = parse_whisper_json(WHISPER_JSON);

  CHECK(t.language == "en");
  REQUIRE(t.segments.size() == 2);
  CHECK(t.segments[0].text == "Hello there.");
  CHECK(t.segments[1].text == "General Kenobi.");
  CHECK(t.segments[1].words.empty());

  REQUIRE(t.words.size() == 2);
  CHECK(t.words[0].text == "Hello");
  CHECK(t.words[1].text == "there.");
  REQUIRE(t.words[0].confidence.has_value());
  CHECK(*t.words[0].confidence == Approx(0.9));
}

TEST_CASE("parse_whisper_json rejects malformed documents", "[transcript]") {
  CHECK_THROWS_AS(parse_whisper_json("{"), Error);
  CHECK_THROWS_AS(parse_whisper_json(R"({"text": "no segments"})"), Error);
}

TEST_CASE("words_in_range falls back to whole segments", "[transcript]") {
  Transcript t = parse_whisper_json(WHISPER_JSON);

  auto first = t.words_in_range(0.5, 1.0);
  REQUIRE(first.size() == 1);
  CHECK(first[0].text == "there.");

  auto second = t.words_in_range(3.0, 10.0);
  REQUIRE(second.size() == 1);
  CHECK(second[0].text == "General Kenobi.");
  CHECK(second[0].start == Approx(2.5));
}

TEST_CASE("load_transcript reads a file and reports failures",
          "[transcript]") {
  namespace fs = std::filesystem;
  fs::path path = fs::temp_directory_path() / "shortsmith_transcript_test.json";
  {
    std::ofstream out(path);
    out << WHISPER_JSON;
  }

  Transcript t;
  CHECK(load_transcript(path.string(), t));
  CHECK(t.segments.size() == 2);
  fs::remove(path);

  CHECK_FALSE(load_transcript(path.string(), t));
  CHECK(t.empty());
}

TEST_CASE("speech_spans joins segments until a pause", "[transcript]") {
  auto spans = speech_spans(segments_at({{0, 2}, {2.5, 4}, {10, 12}, {12.2, 15}}));

  REQUIRE(spans.size() == 2);
  CHECK(spans[0].start == Approx(0.0));
  CHECK(spans[0].end == Approx(4.0));
  CHECK(spans[1].start == Approx(10.0));
  CHECK(spans[1].end == Approx(15.0));
}

TEST_CASE("speech_spans caps span length", "[transcript]") {
  auto spans = speech_spans(segments_at({{0, 30}, {30, 60}, {60, 90}}),
                            1.0, 60.0, 1.0);

  REQUIRE(spans.size() == 2);
  CHECK(spans[0].end == Approx(60.0));
  CHECK(spans[1].start == Approx(60.0));
  CHECK(spans[1].end == Approx(90.0));
}

TEST_CASE("speech_spans carries short speech across pauses", "[transcript]") {
  auto spans = speech_spans(segments_at({{0, 0.4}, {5, 5.3}, {9, 9.5}}));

  REQUIRE(spans.size() == 1);
  CHECK(spans[0].start == Approx(0.0));
  CHECK(spans[0].end == Approx(9.5));

  CHECK(speech_spans(segments_at({{0, 0.5}})).empty());
  CHECK(speech_spans(Transcript{}).empty());
}
