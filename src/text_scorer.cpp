/**
 * @file text_scorer.cpp
 * @brief Heuristic and remote text scorers
 */

#include "shortsmith/text_scorer.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"
#include "shortsmith/system.hpp"

namespace shortsmith {

namespace {

// **---- Heuristic weights ----**

constexpr double HIGH_IMPACT_WEIGHT = 0.15;
constexpr double CONTENT_INDICATOR_WEIGHT = 0.25;
constexpr double EMOTIONAL_TRIGGER_WEIGHT = 0.3;
constexpr double CALL_TO_ACTION_WEIGHT = 0.2;

constexpr size_t MIN_WORDS = 5;
constexpr size_t OPTIMAL_MIN_WORDS = 10;
constexpr size_t OPTIMAL_MAX_WORDS = 30;

std::string to_lower(const std::string &s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

/// Number of tier keywords occurring anywhere in the (lower-cased) text
int count_hits(const std::string &lower_text,
               const std::vector<std::string> &tier) {
  int hits = 0;
  for (const auto &kw : tier) {
    if (!kw.empty() && lower_text.find(to_lower(kw)) != std::string::npos)
      ++hits;
  }
  return hits;
}

bool is_terminator(char c) { return c == '.' || c == '!' || c == '?'; }

/// Escape a value for a double-quoted curl config entry
std::string curl_config_escape(const std::string &value) {
  std::string out;
  for (char c : value) {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  return out;
}

} // anonymous namespace

// **---- TEXT STATISTICS ----**

size_t count_words(const std::string &text) {
  size_t count = 0;
  bool in_word = false;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

size_t count_sentences(const std::string &text) {
  size_t pieces = 1;
  for (size_t i = 0; i < text.size(); ++i) {
    if (is_terminator(text[i]) && (i == 0 || !is_terminator(text[i - 1])))
      ++pieces;
  }
  return pieces;
}

double heuristic_content_score(const std::string &text,
                               const KeywordTiers &tiers) {
  const std::string lower = to_lower(text);

  const size_t word_count = count_words(lower);
  const size_t sentence_count = count_sentences(lower);
  if (word_count < MIN_WORDS || sentence_count == 0)
    return 0.0;

  double words_per_sentence =
      static_cast<double>(word_count) / static_cast<double>(sentence_count);
  double density_score = std::min(words_per_sentence / 10.0, 1.0);

  double keyword_score =
      count_hits(lower, tiers.high_impact) * HIGH_IMPACT_WEIGHT +
      count_hits(lower, tiers.content_indicator) * CONTENT_INDICATOR_WEIGHT +
      count_hits(lower, tiers.emotional_trigger) * EMOTIONAL_TRIGGER_WEIGHT +
      count_hits(lower, tiers.call_to_action) * CALL_TO_ACTION_WEIGHT;

  bool has_digit = std::any_of(lower.begin(), lower.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });

  double quality_score = 0.0;
  if (lower.find('?') != std::string::npos)
    quality_score += 0.2;
  if (lower.find('!') != std::string::npos)
    quality_score += 0.15;
  if (has_digit)
    quality_score += 0.1;
  if (lower.find('"') != std::string::npos ||
      lower.find('\'') != std::string::npos)
    quality_score += 0.15;
  if (word_count >= OPTIMAL_MIN_WORDS && word_count <= OPTIMAL_MAX_WORDS)
    quality_score += 0.2;

  double final_score =
      keyword_score * 0.4 + quality_score * 0.3 + density_score * 0.3;
  return std::min(final_score, 1.0);
}

// **---- KeywordTextScorer ----**

KeywordTextScorer::KeywordTextScorer(KeywordTiers tiers)
    : tiers_(std::move(tiers)) {}

double KeywordTextScorer::score(const std::string &text) {
  return heuristic_content_score(text, tiers_);
}

// **---- RemoteTextScorer ----**

RemoteTextScorer::RemoteTextScorer(ScorerConfig config)
    : config_(std::move(config)) {}

std::string RemoteTextScorer::build_prompt(const std::string &text) {
  return fmt::format(
      "Rate the following content for its viral potential on social media "
      "platforms like TikTok and Instagram Reels.\n"
      "Consider factors like surprise, emotion, relatability, and "
      "entertainment value.\n"
      "Content: \"{}\"\n"
      "Rate from 0 to 100, where 100 is extremely viral:",
      text);
}

double RemoteTextScorer::parse_response(const std::string &body) {
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    throw ExternalScorerFailure(fmt::format("invalid JSON reply: {}", e.what()));
  }

  std::string generated;
  try {
    if (reply.contains("generations") && reply["generations"].is_array() &&
        !reply["generations"].empty()) {
      generated = reply["generations"][0].at("text").get<std::string>();
    } else if (reply.contains("text")) {
      generated = reply.at("text").get<std::string>();
    } else {
      throw ExternalScorerFailure("reply has no generated text");
    }
  } catch (const nlohmann::json::exception &e) {
    throw ExternalScorerFailure(
        fmt::format("unexpected reply layout: {}", e.what()));
  }

  auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
  auto first = std::find_if(generated.begin(), generated.end(), is_digit);
  if (first == generated.end())
    throw ExternalScorerFailure(
        fmt::format("no rating in reply \"{}\"", generated));
  auto last = std::find_if_not(first, generated.end(), is_digit);
  while (first + 1 < last && *first == '0')
    ++first;

  /// Anything past three significant digits is above 100 and saturates
  if (last - first > 3)
    return 1.0;
  double rating = std::stod(std::string(first, last));
  return std::clamp(rating / 100.0, 0.0, 1.0);
}

std::string RemoteTextScorer::post(const std::string &body) const {
  MemFile body_file("scorer_body");
  MemFile curl_config("scorer_curl");
  if (!body_file.is_valid() || !curl_config.is_valid())
    throw ExternalScorerFailure("failed to create memory files for request");

  std::string cfg;
  cfg += fmt::format("url = \"{}\"\n", curl_config_escape(config_.endpoint));
  cfg += "request = \"POST\"\n";
  cfg += "header = \"Content-Type: application/json\"\n";
  cfg += "header = \"Accept: application/json\"\n";
  cfg += fmt::format("header = \"Authorization: Bearer {}\"\n",
                     curl_config_escape(config_.api_key));
  cfg += fmt::format("data-binary = \"@{}\"\n", body_file.proc_path());
  cfg += fmt::format("max-time = {:.1f}\n", config_.timeout_sec);

  if (!body_file.write_all(body) || !curl_config.write_all(cfg))
    throw ExternalScorerFailure("failed to write request to memory files");

  std::string cmd = fmt::format("curl --silent --show-error --fail -K {} 2>&1",
                                shell_quote(curl_config.proc_path()));

  std::string output;
  int status = run_capture(cmd, output);
  if (status != 0) {
    /// curl exit code 28 is a timeout
    throw ExternalScorerFailure(fmt::format(
        "curl exited with {}{}: {}", status, status == 28 ? " (timeout)" : "",
        output.substr(0, 200)));
  }
  return output;
}

double RemoteTextScorer::score(const std::string &text) {
  if (!config_.enabled())
    throw ExternalScorerFailure("remote scorer has no API key");

  std::string body;
  try {
    nlohmann::json request = {{"model", config_.model},
                              {"prompt", build_prompt(text)},
                              {"max_tokens", 10},
                              {"temperature", 0.3}};
    /// Transcripts may carry non-UTF-8 bytes; replace them with U+FFFD
    body = request.dump(-1, ' ', false,
                        nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &e) {
    throw ExternalScorerFailure(
        fmt::format("failed to encode request: {}", e.what()));
  }

  try {
    return parse_response(post(body));
  } catch (const ExternalScorerFailure &) {
    throw;
  } catch (const std::exception &e) {
    throw ExternalScorerFailure(fmt::format("remote scoring error: {}", e.what()));
  }
}

// **---- FallbackTextScorer ----**

FallbackTextScorer::FallbackTextScorer(std::unique_ptr<TextScorer> primary,
                                       std::unique_ptr<TextScorer> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {}

double FallbackTextScorer::score(const std::string &text) {
  try {
    return primary_->score(text);
  } catch (const ExternalScorerFailure &e) {
    ++fallbacks_;
    LOG_WARN("{} scoring failed, using {}: {}", primary_->name(),
             fallback_->name(), e.what());
    return fallback_->score(text);
  }
}

std::string FallbackTextScorer::name() const {
  return fmt::format("{}+{}", primary_->name(), fallback_->name());
}

// **---- Factory ----**

std::unique_ptr<TextScorer> make_text_scorer(const KeywordTiers &tiers,
                                             const ScorerConfig &scorer) {
  auto heuristic = std::make_unique<KeywordTextScorer>(tiers);
  if (!scorer.enabled())
    return heuristic;
  return std::make_unique<FallbackTextScorer>(
      std::make_unique<RemoteTextScorer>(scorer), std::move(heuristic));
}

} // namespace shortsmith
