/**
 * @file highlight_selector.cpp
 * @brief Highlight selection implementation
 */

#include "shortsmith/highlight_selector.hpp"

#include <algorithm>
#include <utility>

#include "shortsmith/candidate_builder.hpp"
#include "shortsmith/highlight_scorer.hpp"
#include "shortsmith/logging.hpp"

namespace shortsmith {

bool windows_overlap(const CandidateGroup &a, const CandidateGroup &b) {
  return a.start_time < b.end_time && a.end_time > b.start_time;
}

std::vector<CandidateGroup>
select_non_overlapping(std::vector<CandidateGroup> scored,
                       size_t max_highlights) {
  std::vector<CandidateGroup> accepted;
  if (max_highlights == 0)
    return accepted;

  std::stable_sort(scored.begin(), scored.end(),
                   [](const CandidateGroup &a, const CandidateGroup &b) {
                     return a.score > b.score;
                   });

  for (auto &candidate : scored) {
    bool overlaps = std::any_of(
        accepted.begin(), accepted.end(),
        [&](const CandidateGroup &s) { return windows_overlap(candidate, s); });
    if (overlaps)
      continue;

    accepted.push_back(std::move(candidate));
    if (accepted.size() >= max_highlights)
      break;
  }
  return accepted;
}

HighlightSelector::HighlightSelector(EngineConfig config,
                                     std::unique_ptr<TextScorer> text_scorer)
    : config_(std::move(config)), text_scorer_(std::move(text_scorer)) {
  config_.validate();
  if (!text_scorer_)
    text_scorer_ = std::make_unique<KeywordTextScorer>(config_.keywords);
}

std::vector<Highlight>
HighlightSelector::select(const std::vector<Scene> &scenes,
                          const std::vector<Word> &words) const {
  return select(scenes, words, config_.max_highlights, config_.min_duration,
                config_.max_duration);
}

std::vector<Highlight>
HighlightSelector::select(const std::vector<Scene> &scenes,
                          const std::vector<Word> &words, int max_highlights,
                          double min_duration, double max_duration) const {
  EngineConfig run = config_;
  run.max_highlights = max_highlights;
  run.min_duration = min_duration;
  run.max_duration = max_duration;
  run.validate();

  TIMER_START(build_candidates);
  std::vector<CandidateGroup> candidates = build_candidates(scenes, words, run);
  TIMER_END(build_candidates);

  TIMER_START(score_candidates);
  HighlightScorer scorer(*text_scorer_);
  scorer.score_all(candidates, run.score_threads);
  TIMER_END(score_candidates);

  const size_t candidate_count = candidates.size();
  std::vector<CandidateGroup> accepted = select_non_overlapping(
      std::move(candidates), static_cast<size_t>(run.max_highlights));

  std::vector<Highlight> highlights;
  highlights.reserve(accepted.size());
  for (auto &g : accepted) {
    Highlight h;
    h.start_time = g.start_time;
    h.end_time = g.end_time;
    h.score = g.score;
    h.text = std::move(g.text);
    h.anchor_scene = g.first_scene;
    highlights.push_back(std::move(h));
  }

  LOG_INFO("Selected {} of {} candidates ({} scorer)", highlights.size(),
           candidate_count, text_scorer_->name());
  return highlights;
}

} // namespace shortsmith
