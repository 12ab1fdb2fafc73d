/**
 * @file text_scorer.hpp
 * @brief Engagement scoring of transcript text
 *
 * @details TextScorer is the capability interface behind the content
 *          sub-score. Implementations:
 *
 *          - KeywordTextScorer: local lexical heuristic over four weighted
 *            keyword tiers plus punctuation / length / density signals.
 *
 *          - RemoteTextScorer: asks an LLM generate endpoint for a 0-100
 *            rating via the curl client. Throws ExternalScorerFailure.
 *
 *          - FallbackTextScorer: tries a primary scorer and falls back to a
 *            secondary one when the primary throws ExternalScorerFailure.
 *
 * @note The implementation is chosen once, at construction time, by
 *       make_text_scorer().
 */

#ifndef SHORTSMITH_TEXT_SCORER_HPP
#define SHORTSMITH_TEXT_SCORER_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "config.hpp"

namespace shortsmith {

// **---- TEXT STATISTICS ----**

/// Number of whitespace-separated tokens
size_t count_words(const std::string &text);

/**
 * @brief Number of pieces the text splits into on runs of '.', '!' or '?'.
 * @note A trailing terminator yields an empty last piece, which is counted.
 */
size_t count_sentences(const std::string &text);

/**
 * @brief The local content heuristic.
 * @return 0 for fewer than five words, otherwise a value in [0,1]
 */
double heuristic_content_score(const std::string &text,
                               const KeywordTiers &tiers);

// **---- SCORERS ----**

class TextScorer {
public:
  virtual ~TextScorer() = default;

  /**
   * @brief Score text for engagement.
   * @return Value in [0,1]
   * @throws ExternalScorerFailure (remote implementations only)
   */
  virtual double score(const std::string &text) = 0;

  virtual std::string name() const = 0;
};

class KeywordTextScorer : public TextScorer {
public:
  explicit KeywordTextScorer(KeywordTiers tiers = KeywordTiers::defaults());

  double score(const std::string &text) override;
  std::string name() const override { return "keywords"; }

private:
  KeywordTiers tiers_;
};

/**
 * @class RemoteTextScorer
 * @brief LLM-backed scorer reached through the curl command-line client.
 *
 * @attention The request body and the curl config (URL, headers, timeout)
 *            are written to memfd files so that neither the text nor the API
 *            key appears on a command line.
 */
class RemoteTextScorer : public TextScorer {
public:
  explicit RemoteTextScorer(ScorerConfig config);

  double score(const std::string &text) override;
  std::string name() const override { return "remote"; }

  /// The prompt sent for a given text
  static std::string build_prompt(const std::string &text);

  /**
   * @brief Extract the rating from a generate response body.
   * @return First integer in the generated text / 100, clamped to [0,1]
   * @throws ExternalScorerFailure on invalid JSON or a reply without a number
   */
  static double parse_response(const std::string &body);

private:
  ScorerConfig config_;

  std::string post(const std::string &body) const;
};

class FallbackTextScorer : public TextScorer {
public:
  FallbackTextScorer(std::unique_ptr<TextScorer> primary,
                     std::unique_ptr<TextScorer> fallback);

  double score(const std::string &text) override;
  std::string name() const override;

  /// How many calls were answered by the fallback
  size_t fallback_count() const { return fallbacks_.load(); }

private:
  std::unique_ptr<TextScorer> primary_;
  std::unique_ptr<TextScorer> fallback_;
  std::atomic<size_t> fallbacks_{0};
};

/**
 * @brief Build the scorer for this configuration.
 * @return KeywordTextScorer, or a FallbackTextScorer(remote, keywords) when
 *         scorer.enabled()
 */
std::unique_ptr<TextScorer> make_text_scorer(const KeywordTiers &tiers,
                                             const ScorerConfig &scorer);

} // namespace shortsmith

#endif // SHORTSMITH_TEXT_SCORER_HPP
