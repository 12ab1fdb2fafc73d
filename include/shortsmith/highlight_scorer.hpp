/**
 * @file highlight_scorer.hpp
 * @brief Scoring of candidate windows
 *
 * @details total = 0.5 * content + 0.3 * context + 0.2 * transition
 *
 *          - content: TextScorer verdict on the group's text, in [0,1]
 *
 *          - context: word count / 100, not clamped
 *
 *          - transition: scene count / 10, not clamped
 *
 * @note The total is not clamped either; long, scene-rich windows can score
 *       above 1.
 */

#ifndef SHORTSMITH_HIGHLIGHT_SCORER_HPP
#define SHORTSMITH_HIGHLIGHT_SCORER_HPP

#include <string>
#include <vector>

#include "text_scorer.hpp"
#include "types.hpp"

namespace shortsmith {

constexpr double CONTENT_WEIGHT = 0.5;
constexpr double CONTEXT_WEIGHT = 0.3;
constexpr double TRANSITION_WEIGHT = 0.2;

double context_score(const std::string &text);
double transition_score(size_t scene_count);

double combine_scores(double content, double context, double transition);

class HighlightScorer {
public:
  /**
   * @param text_scorer Content scorer (not owned, must outlive this object
   *        and be safe to call from several threads)
   */
  explicit HighlightScorer(TextScorer &text_scorer);

  double score(const CandidateGroup &group) const;

  /**
   * @brief Score every group in place.
   * @param num_threads Worker threads (0 = auto, 1 = inline)
   * @note Each group is scored independently; results do not depend on the
   *       thread count.
   */
  void score_all(std::vector<CandidateGroup> &groups, int num_threads = 0) const;

private:
  TextScorer &text_scorer_;
};

} // namespace shortsmith

#endif // SHORTSMITH_HIGHLIGHT_SCORER_HPP
