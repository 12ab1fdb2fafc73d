/**
 * @file candidate_builder.cpp
 * @brief Candidate window generation implementation
 */

#include "shortsmith/candidate_builder.hpp"

#include <algorithm>

#include "shortsmith/logging.hpp"
#include "shortsmith/scene_merger.hpp"

namespace shortsmith {

namespace {

/// A silent scene followed by a speaking one marks a pause worth cutting at
bool is_natural_break(const std::vector<Scene> &scenes, size_t i, size_t j) {
  return j > i && j + 1 < scenes.size() && !scenes[j].has_speech() &&
         scenes[j + 1].has_speech();
}

CandidateGroup make_group(const std::vector<Scene> &scenes,
                          const std::vector<Word> &sorted_words, size_t first,
                          size_t last, const EngineConfig &config) {
  CandidateGroup g;
  g.first_scene = first;
  g.last_scene = last;

  const double group_start = scenes[first].start_time();
  const double group_end = scenes[last].end_time();

  g.start_time = std::max(0.0, group_start - config.context_window);
  if (config.legacy_right_pad) {
    g.end_time = std::min(group_end + config.context_window, group_end);
  } else {
    g.end_time =
        std::min(group_end + config.context_window, scenes.back().end_time());
  }

  g.text = text_in_range(sorted_words, g.start_time, g.end_time);
  return g;
}

} // anonymous namespace

double adaptive_max_duration(double min_duration, double max_duration,
                             double speech_density, double content_richness) {
  double stretch = 0.5 * speech_density + 0.5 * content_richness;
  return std::min(max_duration,
                  min_duration + (max_duration - min_duration) * stretch);
}

std::string text_in_range(const std::vector<Word> &sorted_words, double start,
                          double end) {
  auto it = std::lower_bound(
      sorted_words.begin(), sorted_words.end(), start,
      [](const Word &w, double t) { return w.start < t; });

  std::string text;
  for (; it != sorted_words.end() && it->start <= end; ++it) {
    if (it->end > end || it->text.empty())
      continue;
    if (!text.empty())
      text += ' ';
    text += it->text;
  }
  return text;
}

std::vector<CandidateGroup> build_candidates(const std::vector<Scene> &scenes,
                                             const std::vector<Word> &words,
                                             const EngineConfig &config) {
  config.validate();
  validate_scenes(scenes);

  std::vector<CandidateGroup> groups;
  if (scenes.empty())
    return groups;

  std::vector<Word> sorted_words(words);
  std::stable_sort(sorted_words.begin(), sorted_words.end(),
                   [](const Word &a, const Word &b) { return a.start < b.start; });

  const size_t n = scenes.size();
  const double fps = config.density_fps;

  for (size_t i = 0; i < n; ++i) {
    double current_duration = 0.0;
    double speech_frames = 0.0;
    double total_frames = 0.0;

    for (size_t j = i; j < n; ++j) {
      const Scene &scene = scenes[j];
      current_duration += scene.duration();
      speech_frames += scene.speech_duration() * fps;
      total_frames += scene.duration() * fps;

      double speech_density = speech_frames / std::max(1.0, total_frames);
      double content_richness =
          std::min(1.0, static_cast<double>(j - i + 1) / 10.0);

      double adaptive_min = config.min_duration;
      double adaptive_max =
          adaptive_max_duration(config.min_duration, config.max_duration,
                                speech_density, content_richness);

      bool good_duration = adaptive_min <= current_duration &&
                           current_duration <= adaptive_max;
      bool break_here = current_duration >= adaptive_min &&
                        is_natural_break(scenes, i, j);

      if (good_duration || break_here) {
        size_t first = (i > 0) ? i - 1 : 0;
        size_t last = std::min(n - 1, j + 1);
        CandidateGroup g = make_group(scenes, sorted_words, first, last, config);
        g.generation_index = groups.size();
        groups.push_back(std::move(g));
      }

      /// Hard ceiling, independent of the adaptive band
      if (current_duration > config.max_duration)
        break;
    }
  }

  LOG_DEBUG("Built {} candidates from {} scenes", groups.size(), n);
  return groups;
}

} // namespace shortsmith
