/**
 * @file highlight_scorer.cpp
 * @brief Candidate scoring implementation
 */

#include "shortsmith/highlight_scorer.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

#include "shortsmith/logging.hpp"
#include "shortsmith/system.hpp"

namespace shortsmith {

double context_score(const std::string &text) {
  return static_cast<double>(count_words(text)) / 100.0;
}

double transition_score(size_t scene_count) {
  return static_cast<double>(scene_count) / 10.0;
}

double combine_scores(double content, double context, double transition) {
  return content * CONTENT_WEIGHT + context * CONTEXT_WEIGHT +
         transition * TRANSITION_WEIGHT;
}

HighlightScorer::HighlightScorer(TextScorer &text_scorer)
    : text_scorer_(text_scorer) {}

double HighlightScorer::score(const CandidateGroup &group) const {
  double content = text_scorer_.score(group.text);
  return combine_scores(content, context_score(group.text),
                        transition_score(group.scene_count()));
}

void HighlightScorer::score_all(std::vector<CandidateGroup> &groups,
                                int num_threads) const {
  if (groups.empty())
    return;

  int workers_needed = resolve_worker_count(num_threads, groups.size());
  if (workers_needed == 1) {
    for (auto &g : groups)
      g.score = score(g);
    return;
  }

  /// Workers claim candidates by index; each slot is written by one thread
  std::atomic<size_t> next{0};
  std::exception_ptr failure;
  std::mutex failure_mutex;

  std::vector<std::thread> workers;
  workers.reserve(workers_needed);
  for (int w = 0; w < workers_needed; ++w) {
    workers.emplace_back([this, &groups, &next, &failure, &failure_mutex]() {
      try {
        size_t k;
        while ((k = next.fetch_add(1)) < groups.size()) {
          groups[k].score = score(groups[k]);
        }
      } catch (...) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failure)
          failure = std::current_exception();
        next.store(groups.size());
      }
    });
  }
  for (auto &t : workers)
    t.join();

  if (failure)
    std::rethrow_exception(failure);

  LOG_DEBUG("Scored {} candidates on {} threads", groups.size(),
            workers_needed);
}

} // namespace shortsmith
