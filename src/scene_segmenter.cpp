/**
 * @file scene_segmenter.cpp
 * @brief Scene boundary detection implementation
 */

#include "shortsmith/scene_segmenter.hpp"

#include <algorithm>
#include <cstdint>

#include <fmt/core.h>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"

namespace shortsmith {

std::vector<TimeSegment> clip_speech(const std::vector<TimeSegment> &speech,
                                     double start, double end) {
  std::vector<TimeSegment> clipped;
  for (const auto &s : speech) {
    /// Strict overlap: a span that only touches the scene edge is skipped
    if (s.start < end && s.end > start) {
      clipped.push_back({std::max(start, s.start), std::min(end, s.end)});
    }
  }
  return clipped;
}

SceneSegmenter::SceneSegmenter(double min_scene_len, double threshold)
    : min_scene_len_(min_scene_len), threshold_(threshold) {}

std::vector<Scene>
SceneSegmenter::detect_scenes(const FrameDiffSignal &signal,
                              const std::vector<TimeSegment> &speech) const {
  std::vector<Scene> scenes;
  if (signal.frame_count <= 0)
    return scenes;
  if (signal.fps <= 0)
    throw InvalidInputError(
        fmt::format("frame rate must be positive (got {})", signal.fps));

  const double fps = signal.fps;
  const double duration = signal.duration();
  const double threshold = threshold_ / 255.0;
  const int64_t min_scene_frames = static_cast<int64_t>(min_scene_len_ * fps);

  int64_t current_scene_start = 0;
  int64_t last_index = 0;

  for (const auto &sample : signal.samples) {
    if (sample.frame_index <= last_index)
      throw InvalidInputError(fmt::format(
          "frame difference samples out of order at frame {}",
          sample.frame_index));
    if (sample.frame_index >= signal.frame_count)
      throw InvalidInputError(fmt::format(
          "frame difference sample at frame {} is past the last frame ({})",
          sample.frame_index, signal.frame_count - 1));
    last_index = sample.frame_index;

    if (sample.value > threshold &&
        sample.frame_index - current_scene_start >= min_scene_frames) {
      double start = current_scene_start / fps;
      double end = sample.frame_index / fps;
      scenes.emplace_back(start, end, clip_speech(speech, start, end));
      current_scene_start = sample.frame_index;
    }
  }

  // **---- CLOSE THE TAIL ----**

  if (current_scene_start < signal.frame_count - 1 || scenes.empty()) {
    double start = current_scene_start / fps;
    scenes.emplace_back(start, duration, clip_speech(speech, start, duration));
  } else if (scenes.back().end_time() < duration) {
    /// A boundary on the very last frame leaves a one-frame gap; stretch the
    /// last scene over it so the sequence still ends at the video duration
    double start = scenes.back().start_time();
    scenes.back() = Scene(start, duration, clip_speech(speech, start, duration));
  }

  LOG_DEBUG("Segmented {:.1f}s into {} scenes", duration, scenes.size());
  return scenes;
}

} // namespace shortsmith
