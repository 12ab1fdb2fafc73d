/**
 * @file highlight_selector.hpp
 * @brief Greedy non-overlapping highlight selection
 *
 * @details Pipeline: build candidates, score them, stable-sort by score
 *          (descending, generation order on ties), then accept each
 *          candidate that does not overlap an accepted one until
 *          max_highlights are accepted.
 *
 * @note Greedy by score, not an optimal interval scheduler: it favours the
 *       most engaging windows over total coverage.
 */

#ifndef SHORTSMITH_HIGHLIGHT_SELECTOR_HPP
#define SHORTSMITH_HIGHLIGHT_SELECTOR_HPP

#include <memory>
#include <vector>

#include "config.hpp"
#include "text_scorer.hpp"
#include "types.hpp"

namespace shortsmith {

/// Half-open overlap test between two candidate windows
bool windows_overlap(const CandidateGroup &a, const CandidateGroup &b);

/**
 * @brief Greedy interval selection over already scored candidates.
 * @param scored Candidates with score set, in generation order
 * @param max_highlights Upper bound on accepted candidates
 * @return Accepted candidates in acceptance (score) order
 */
std::vector<CandidateGroup>
select_non_overlapping(std::vector<CandidateGroup> scored,
                       size_t max_highlights);

class HighlightSelector {
public:
  /**
   * @param config Engine parameters (durations, context, threads, keywords)
   * @param text_scorer Content scorer; a KeywordTextScorer over
   *        config.keywords when null
   * @throws InvalidInputError if config is inconsistent
   */
  explicit HighlightSelector(EngineConfig config,
                             std::unique_ptr<TextScorer> text_scorer = nullptr);

  /**
   * @brief Select highlights with the configured limits.
   * @throws InvalidInputError on an invalid scene sequence
   */
  std::vector<Highlight> select(const std::vector<Scene> &scenes,
                                const std::vector<Word> &words) const;

  /**
   * @brief Select highlights with explicit limits.
   * @return At most max_highlights pairwise non-overlapping highlights
   * @throws InvalidInputError on an invalid scene sequence or when
   *         min_duration > max_duration
   */
  std::vector<Highlight> select(const std::vector<Scene> &scenes,
                                const std::vector<Word> &words,
                                int max_highlights, double min_duration,
                                double max_duration) const;

  const EngineConfig &config() const { return config_; }
  TextScorer &text_scorer() const { return *text_scorer_; }

private:
  EngineConfig config_;
  std::unique_ptr<TextScorer> text_scorer_;
};

} // namespace shortsmith

#endif // SHORTSMITH_HIGHLIGHT_SELECTOR_HPP
