/**
 * @file types.hpp
 * @brief Core data types shared by every Shortsmith stage
 *
 * @details Contains the immutable records that flow through the engine:
 *          - TimeSegment for speech spans
 *
 *          - Scene for visually coherent spans of video
 *
 *          - Word for timestamped transcript units
 *
 *          - CandidateGroup for prospective highlight windows
 *
 *          - Highlight for the final selection
 *
 *          - FrameDiffSample / FrameDiffSignal for the segmenter input
 */

#ifndef SHORTSMITH_TYPES_HPP
#define SHORTSMITH_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shortsmith {

// **----- CONSTANTS -----**

/**
 * @brief Width and height of the grayscale thumbnails compared by the
 *        frame-difference scanner.
 */
constexpr int DIFF_FRAME_WIDTH = 320;
constexpr int DIFF_FRAME_HEIGHT = 180;

/**
 * @brief CPU cache line size for alignment.
 * @note Aligning per-thread counters to cache lines prevents false sharing.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

// **----- DATA STRUCTURES -----**

/**
 * @struct TimeSegment
 * @brief Represents a time range [start, end] in seconds.
 * @note Used for speech spans, both raw and clipped to a scene.
 */
struct TimeSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double length() const { return end - start; }
};

/**
 * @class Scene
 * @brief A visually coherent span of video with its attached speech.
 *
 * @note Scenes are immutable once constructed. Merging two scenes creates a
 *       new Scene; the derived speech statistics are computed once here.
 */
class Scene {
public:
  Scene(double start_time, double end_time,
        std::vector<TimeSegment> speech_segments = {});

  double start_time() const { return start_time_; }
  double end_time() const { return end_time_; }
  double duration() const { return end_time_ - start_time_; }

  const std::vector<TimeSegment> &speech_segments() const {
    return speech_segments_;
  }
  bool has_speech() const { return !speech_segments_.empty(); }

  /// Sum of the lengths of all attached speech segments
  double speech_duration() const { return speech_duration_; }

  /// speech_duration / duration, 0 for a zero-length scene
  double speech_density() const;

  /**
   * @brief Fuse two scenes into one spanning a.start to b.end.
   * @note Speech segments are concatenated in order, not re-sorted.
   */
  static Scene fuse(const Scene &a, const Scene &b);

private:
  double start_time_;
  double end_time_;
  std::vector<TimeSegment> speech_segments_;
  double speech_duration_ = 0.0;
};

/**
 * @struct Word
 * @brief Atomic transcript unit with its timestamps.
 */
struct Word {
  std::string text;
  double start = 0.0;
  double end = 0.0;
  std::optional<double> confidence; //< In [0,1] when the recognizer reports it
};

/**
 * @struct CandidateGroup
 * @brief A prospective highlight window built from contiguous scenes.
 *
 * @note The scenes are referenced by index range [first_scene, last_scene]
 *       into the sequence the group was built from. The range already
 *       includes the one-scene context on each side.
 */
struct CandidateGroup {
  size_t first_scene = 0; //< Index of the first scene (inclusive)
  size_t last_scene = 0;  //< Index of the last scene (inclusive)
  double start_time = 0.0;
  double end_time = 0.0;
  std::string text;
  double score = 0.0;
  size_t generation_index = 0; //< Position in generation order

  double duration() const { return end_time - start_time; }
  size_t scene_count() const { return last_scene - first_scene + 1; }
};

/**
 * @struct Highlight
 * @brief A selected, non-overlapping clip ready for rendering.
 *
 * @note anchor_scene indexes the scene sequence passed to the selector. The
 *       highlight never owns that scene; use anchor() to read it.
 */
struct Highlight {
  double start_time = 0.0;
  double end_time = 0.0;
  double score = 0.0;
  std::string text;
  size_t anchor_scene = 0;

  double duration() const { return end_time - start_time; }

  const Scene &anchor(const std::vector<Scene> &scenes) const {
    return scenes.at(anchor_scene);
  }
};

/**
 * @struct FrameDiffSample
 * @brief Dissimilarity between one sampled frame and the previous sample.
 */
struct FrameDiffSample {
  int64_t frame_index; //< Index of the sampled frame in the full stream
  double value;        //< Normalized mean absolute difference in [0,1]
};

/**
 * @struct FrameDiffSignal
 * @brief The scalar stream consumed by the SceneSegmenter.
 *
 * @note samples[k] compares sampled frame k+1 with sampled frame k; the very
 *       first sampled frame (index 0) has no entry.
 */
struct FrameDiffSignal {
  double fps = 0.0;
  int64_t frame_count = 0;
  std::vector<FrameDiffSample> samples;

  double duration() const { return fps > 0 ? frame_count / fps : 0.0; }
};

} // namespace shortsmith

#endif // SHORTSMITH_TYPES_HPP
