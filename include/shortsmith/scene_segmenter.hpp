/**
 * @file scene_segmenter.hpp
 * @brief Scene boundary detection over a frame-difference signal
 *
 * @details The SceneSegmenter walks the sampled dissimilarity stream and
 *          closes a scene whenever the dissimilarity exceeds the threshold
 *          and the open scene is at least min_scene_len long. Speech spans
 *          overlapping a scene are clipped to its bounds and attached.
 *
 * @note The output is contiguous, non-overlapping and covers
 *       [0, frame_count / fps].
 */

#ifndef SHORTSMITH_SCENE_SEGMENTER_HPP
#define SHORTSMITH_SCENE_SEGMENTER_HPP

#include <vector>

#include "types.hpp"

namespace shortsmith {

/**
 * @brief Clip every speech span to [start, end] and keep the non-empty
 *        intersections, in input order.
 *
 * Overlap is strict: a span that only touches start or end would clip to
 * zero length and is dropped, so a scene whose only speech sits on its
 * edge counts as silent for natural-break detection.
 */
std::vector<TimeSegment> clip_speech(const std::vector<TimeSegment> &speech,
                                     double start, double end);

class SceneSegmenter {
public:
  /**
   * @param min_scene_len Minimum scene length in seconds
   * @param threshold Boundary threshold in the 0-255 pixel unit
   */
  explicit SceneSegmenter(double min_scene_len = 0.5, double threshold = 27.0);

  /**
   * @brief Split the video into scenes.
   *
   * @param signal Sampled dissimilarities plus fps and frame count
   * @param speech Coarse speech spans (any order, may overlap boundaries)
   * @return Scenes covering the whole video, empty when frame_count is 0
   * @throws InvalidInputError if fps is not positive, the samples are not
   *         in increasing frame order, or a sample lies at or past
   *         frame_count
   */
  std::vector<Scene> detect_scenes(const FrameDiffSignal &signal,
                                   const std::vector<TimeSegment> &speech) const;

  double min_scene_len() const { return min_scene_len_; }
  double threshold() const { return threshold_; }

private:
  double min_scene_len_;
  double threshold_;
};

} // namespace shortsmith

#endif // SHORTSMITH_SCENE_SEGMENTER_HPP
