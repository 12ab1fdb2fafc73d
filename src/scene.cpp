/**
 * @file scene.cpp
 * @brief Scene construction and fusion
 */

#include "shortsmith/types.hpp"

#include <utility>

namespace shortsmith {

Scene::Scene(double start_time, double end_time,
             std::vector<TimeSegment> speech_segments)
    : start_time_(start_time), end_time_(end_time),
      speech_segments_(std::move(speech_segments)) {
  for (const auto &s : speech_segments_) {
    speech_duration_ += s.length();
  }
}

double Scene::speech_density() const {
  double d = duration();
  return d > 0 ? speech_duration_ / d : 0.0;
}

Scene Scene::fuse(const Scene &a, const Scene &b) {
  std::vector<TimeSegment> speech;
  speech.reserve(a.speech_segments_.size() + b.speech_segments_.size());
  speech.insert(speech.end(), a.speech_segments_.begin(),
                a.speech_segments_.end());
  speech.insert(speech.end(), b.speech_segments_.begin(),
                b.speech_segments_.end());
  return Scene(a.start_time_, b.end_time_, std::move(speech));
}

} // namespace shortsmith
