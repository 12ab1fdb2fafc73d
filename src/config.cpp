/**
 * @file config.cpp
 * @brief Environment configuration helpers and engine aggregates
 */

#include "shortsmith/config.hpp"

#include <fstream>

#include <fmt/core.h>

#include "shortsmith/errors.hpp"

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

std::string unquote(const std::string &s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') &&
      s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

} // anonymous namespace

namespace Config {

std::vector<std::string> split_list(const std::string &text) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find(',', pos);
    if (end == std::string::npos)
      end = text.size();
    std::string item = trim(text.substr(pos, end - pos));
    if (!item.empty())
      items.push_back(item);
    pos = end + 1;
  }
  return items;
}

std::vector<std::string>
get_env_list(const char *name, const std::vector<std::string> &default_val) {
  const char *val = std::getenv(name);
  return val ? split_list(val) : default_val;
}

int load_env_file(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    return -1;

  int exported = 0;
  std::string line;
  while (std::getline(f, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    if (line.compare(0, 7, "export ") == 0)
      line = trim(line.substr(7));

    size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;

    std::string key = trim(line.substr(0, eq));
    std::string value = unquote(trim(line.substr(eq + 1)));
    if (std::getenv(key.c_str()) != nullptr)
      continue;
    if (setenv(key.c_str(), value.c_str(), 0) == 0)
      ++exported;
  }
  return exported;
}

} // namespace Config

// **---- KeywordTiers ----**

KeywordTiers KeywordTiers::defaults() {
  KeywordTiers t;
  t.high_impact = {"amazing",      "awesome",        "incredible",
                   "shocking",     "mind-blowing",   "insane",
                   "unbelievable", "viral",          "trending",
                   "epic",         "revolutionary",  "game-changing",
                   "breakthrough", "genius",         "masterpiece",
                   "perfect",      "stunning",       "extraordinary",
                   "phenomenal",   "legendary",      "important",
                   "key point",    "essential",      "crucial",
                   "highlight",    "main idea",      "summary",
                   "conclusion",   "therefore",      "result"};
  t.content_indicator = {"consequently", "because", "explains",
                         "demonstrates", "shows",   "proves"};
  /// Empty by default so the stock scores match the single keyword list;
  /// fill through KEYWORDS_EMOTIONAL_TRIGGER / KEYWORDS_CALL_TO_ACTION.
  t.emotional_trigger = {};
  t.call_to_action = {};
  return t;
}

KeywordTiers KeywordTiers::from_env() {
  KeywordTiers d = defaults();
  KeywordTiers t;
  t.high_impact = Config::get_env_list("KEYWORDS_HIGH_IMPACT", d.high_impact);
  t.content_indicator =
      Config::get_env_list("KEYWORDS_CONTENT_INDICATOR", d.content_indicator);
  t.emotional_trigger =
      Config::get_env_list("KEYWORDS_EMOTIONAL_TRIGGER", d.emotional_trigger);
  t.call_to_action =
      Config::get_env_list("KEYWORDS_CALL_TO_ACTION", d.call_to_action);
  return t;
}

// **---- EngineConfig ----**

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  c.min_scene_len = Config::min_scene_len();
  c.scene_threshold = Config::scene_threshold();
  c.merge_min_duration = Config::scene_merge_min_sec();
  c.min_duration = Config::min_highlight_sec();
  c.max_duration = Config::max_highlight_sec();
  c.max_highlights = Config::max_highlights();
  c.context_window = Config::context_window_sec();
  c.legacy_right_pad = Config::legacy_right_pad();
  c.density_fps = Config::density_fps();
  c.score_threads = Config::score_threads();
  c.keywords = KeywordTiers::from_env();
  return c;
}

void EngineConfig::validate() const {
  if (min_scene_len < 0)
    throw InvalidInputError(
        fmt::format("min_scene_len must be >= 0 (got {})", min_scene_len));
  if (scene_threshold < 0 || scene_threshold > 255)
    throw InvalidInputError(fmt::format(
        "scene_threshold must be in [0,255] (got {})", scene_threshold));
  if (merge_min_duration < 0)
    throw InvalidInputError(fmt::format(
        "merge_min_duration must be >= 0 (got {})", merge_min_duration));
  if (min_duration < 0 || max_duration < 0)
    throw InvalidInputError(
        fmt::format("highlight durations must be >= 0 (got {} / {})",
                    min_duration, max_duration));
  if (min_duration > max_duration)
    throw InvalidInputError(
        fmt::format("min_duration {} exceeds max_duration {}", min_duration,
                    max_duration));
  if (max_highlights < 0)
    throw InvalidInputError(
        fmt::format("max_highlights must be >= 0 (got {})", max_highlights));
  if (context_window < 0)
    throw InvalidInputError(
        fmt::format("context_window must be >= 0 (got {})", context_window));
  if (density_fps <= 0)
    throw InvalidInputError(
        fmt::format("density_fps must be > 0 (got {})", density_fps));
}

// **---- ScorerConfig ----**

ScorerConfig ScorerConfig::from_env() {
  ScorerConfig c;
  c.api_key = Config::scorer_api_key();
  c.endpoint = Config::scorer_endpoint();
  c.model = Config::scorer_model();
  c.timeout_sec = Config::scorer_timeout_sec();
  return c;
}

} // namespace shortsmith
