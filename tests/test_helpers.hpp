/**
 * @file test_helpers.hpp
 * @brief Builders and fake scorers shared by the unit tests
 */

#ifndef SHORTSMITH_TEST_HELPERS_HPP
#define SHORTSMITH_TEST_HELPERS_HPP

#include <atomic>
#include <string>
#include <vector>

#include "shortsmith/errors.hpp"
#include "shortsmith/text_scorer.hpp"
#include "shortsmith/types.hpp"

namespace shortsmith {
namespace testing {

/// Contiguous scenes of the given lengths, each fully covered by speech when
/// `speech` is set
inline std::vector<Scene> contiguous_scenes(const std::vector<double> &lengths,
                                            bool speech) {
  std::vector<Scene> scenes;
  double t = 0.0;
  for (double len : lengths) {
    std::vector<TimeSegment> segs;
    if (speech)
      segs.push_back({t, t + len});
    scenes.emplace_back(t, t + len, segs);
    t += len;
  }
  return scenes;
}

/// One word per second over [start, end), each lasting half a second
inline std::vector<Word> words_every_second(double start, double end,
                                            const std::string &text) {
  std::vector<Word> words;
  for (double t = start; t < end; t += 1.0)
    words.push_back({text, t, t + 0.5, {}});
  return words;
}

inline CandidateGroup group(double start, double end, double score,
                            size_t generation_index) {
  CandidateGroup g;
  g.start_time = start;
  g.end_time = end;
  g.score = score;
  g.generation_index = generation_index;
  return g;
}

class FixedScorer : public TextScorer {
public:
  explicit FixedScorer(double value) : value_(value) {}
  double score(const std::string &) override {
    ++calls;
    return value_;
  }
  std::string name() const override { return "fixed"; }

  std::atomic<int> calls{0};

private:
  double value_;
};

class FailingScorer : public TextScorer {
public:
  double score(const std::string &) override {
    throw ExternalScorerFailure("service unavailable");
  }
  std::string name() const override { return "failing"; }
};

class BrokenScorer : public TextScorer {
public:
  double score(const std::string &) override {
    throw InvalidInputError("not a scorer failure");
  }
  std::string name() const override { return "broken"; }
};

} // namespace testing
} // namespace shortsmith

#endif // SHORTSMITH_TEST_HELPERS_HPP
