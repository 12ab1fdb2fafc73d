/**
 * @file transcript.cpp
 * @brief Transcript parsing and speech-span grouping
 */

#include "shortsmith/transcript.hpp"

#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"

namespace shortsmith {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

double number_or(const nlohmann::json &obj, const char *key, double fallback) {
  auto it = obj.find(key);
  return (it != obj.end() && it->is_number()) ? it->get<double>() : fallback;
}

std::string string_or(const nlohmann::json &obj, const char *key) {
  auto it = obj.find(key);
  return (it != obj.end() && it->is_string()) ? it->get<std::string>() : "";
}

Word parse_word(const nlohmann::json &w) {
  Word word;
  word.text = trim(w.contains("word") ? string_or(w, "word")
                                      : string_or(w, "text"));
  word.start = number_or(w, "start", 0.0);
  word.end = number_or(w, "end", 0.0);
  auto p = w.find("probability");
  if (p != w.end() && p->is_number())
    word.confidence = p->get<double>();
  return word;
}

} // anonymous namespace

std::vector<Word> Transcript::words_in_range(double start, double end) const {
  std::vector<Word> matching;
  for (const auto &seg : segments) {
    if (seg.start > end || seg.end < start)
      continue;
    if (seg.words.empty()) {
      matching.push_back({seg.text, seg.start, seg.end, {}});
      continue;
    }
    for (const auto &w : seg.words) {
      if (w.start >= start && w.start <= end)
        matching.push_back(w);
    }
  }
  return matching;
}

Transcript parse_whisper_json(const std::string &json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception &e) {
    throw Error(fmt::format("transcript is not valid JSON: {}", e.what()));
  }

  if (!doc.is_object() || !doc.contains("segments") ||
      !doc["segments"].is_array())
    throw Error("transcript has no \"segments\" array");

  Transcript t;
  t.language = string_or(doc, "language");

  for (const auto &s : doc["segments"]) {
    if (!s.is_object())
      continue;
    TranscriptSegment seg;
    seg.text = trim(string_or(s, "text"));
    if (seg.text.empty())
      continue;
    seg.start = number_or(s, "start", 0.0);
    seg.end = number_or(s, "end", 0.0);

    auto words = s.find("words");
    if (words != s.end() && words->is_array()) {
      for (const auto &w : *words) {
        if (!w.is_object() || !w.contains("start") || !w.contains("end"))
          continue;
        Word word = parse_word(w);
        if (word.end - word.start <= 0)
          continue;
        seg.words.push_back(word);
        t.words.push_back(word);
      }
    }
    t.segments.push_back(std::move(seg));
  }
  return t;
}

bool load_transcript(const std::string &path, Transcript &out) {
  out = Transcript{};
  std::ifstream f(path);
  if (!f) {
    LOG_ERROR("Failed to open transcript: {}", path);
    return false;
  }
  std::stringstream buffer;
  buffer << f.rdbuf();

  try {
    out = parse_whisper_json(buffer.str());
  } catch (const Error &e) {
    LOG_ERROR("Failed to parse transcript {}: {}", path, e.what());
    return false;
  }
  return true;
}

std::vector<TimeSegment> speech_spans(const Transcript &transcript,
                                      double min_span, double max_span,
                                      double max_gap) {
  std::vector<TimeSegment> spans;
  const auto &segs = transcript.segments;

  bool open = false;
  double span_start = 0.0;
  double span_end = 0.0;
  double speech = 0.0;

  for (size_t k = 0; k < segs.size(); ++k) {
    const auto &seg = segs[k];
    double seg_len = seg.end - seg.start;

    if (!open) {
      open = true;
      span_start = seg.start;
      span_end = seg.start;
      speech = 0.0;
    }

    if (speech + seg_len > max_span && speech > 0) {
      spans.push_back({span_start, span_end});
      span_start = seg.start;
      speech = 0.0;
    }
    speech += seg_len;
    span_end = seg.end;

    bool last = (k + 1 == segs.size());
    bool pause = !last && segs[k + 1].start - seg.end > max_gap;
    if ((last || pause) && speech >= min_span) {
      spans.push_back({span_start, span_end});
      open = false;
    }
  }
  return spans;
}

} // namespace shortsmith
