/**
 * @file pipeline.hpp
 * @brief End-to-end shorts generation
 *
 * @details The ShortsPipeline class orchestrates the whole workflow:
 *
 *          1. Acquire the source video (local file or yt-dlp download)
 *
 *          2. Transcribe it (or load a supplied Whisper JSON)
 *
 *          3. Scan frame differences in parallel
 *
 *          4. Segment scenes and merge the short ones
 *
 *          5. Select highlights
 *
 *          6. Render vertical shorts with subtitles
 */

#ifndef SHORTSMITH_PIPELINE_HPP
#define SHORTSMITH_PIPELINE_HPP

#include <string>
#include <vector>

#include "transcript.hpp"
#include "types.hpp"

namespace shortsmith {

/**
 * @class ShortsPipeline
 * @brief Runs every stage once for one source.
 */
class ShortsPipeline {
  std::string source_;
  std::string out_dir_;
  std::string transcript_path_;

  std::string video_path_;
  Transcript transcript_;
  std::vector<Scene> scenes_;
  std::vector<Highlight> highlights_;
  std::vector<std::string> rendered_;

  void print_scene_stats() const;
  void print_highlights() const;
  void print_summary() const;

  /// All stages; throws on failure
  int run_stages();

public:
  /**
   * @param source Local video path or URL
   * @param out_dir Directory receiving short_N.mp4 / short_N.srt
   * @param transcript_path Existing Whisper JSON ("" = run whisper)
   */
  ShortsPipeline(std::string source, std::string out_dir,
                 std::string transcript_path = "");

  /**
   * @brief Run the complete pipeline.
   * @return 0 on success, non-zero on error
   */
  int run();

  const std::vector<Scene> &scenes() const { return scenes_; }
  const std::vector<Highlight> &highlights() const { return highlights_; }
  const std::vector<std::string> &rendered() const { return rendered_; }
};

} // namespace shortsmith

#endif // SHORTSMITH_PIPELINE_HPP
