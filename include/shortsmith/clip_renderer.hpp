/**
 * @file clip_renderer.hpp
 * @brief Renders selected highlights as vertical short videos
 *
 * @details For every highlight the renderer:
 *          - Extracts the clip with FFmpeg (re-encoded, frame accurate)
 *
 *          - Scales and pads it to the target vertical frame with a title
 *            bar and a caption bar (retrying without overlays on failure)
 *
 *          - Writes an SRT subtitle file next to the clip
 */

#ifndef SHORTSMITH_CLIP_RENDERER_HPP
#define SHORTSMITH_CLIP_RENDERER_HPP

#include <string>
#include <vector>

#include "transcript.hpp"
#include "types.hpp"

namespace shortsmith {

/**
 * @struct Caption
 * @brief One subtitle line, times relative to the clip start.
 */
struct Caption {
  double start;
  double end;
  std::string text;
};

struct RenderOptions {
  int target_width = 1080;
  int target_height = 1920;
  double min_duration = 30.0;
  double max_duration = 90.0;
  std::string ffmpeg = "ffmpeg";
};

/// Maximum characters per subtitle line
constexpr size_t CAPTION_LINE_CHARS = 40;

/**
 * @brief Output height for a "W:H" aspect ratio at the given width.
 * @throws InvalidInputError on a malformed ratio
 */
int target_height_for(const std::string &aspect_ratio, int width);

/**
 * @brief Title bar text: punctuation removed and upper-cased; longer texts
 *        are cut to their first five words plus "...".
 */
std::string generate_title(const std::string &text);

/**
 * @brief Caption bar text for highlight number `index`.
 * @details First 12 words of the text (plus "..." when cut); a stock line
 *          rotated by index when the text is 10 characters or fewer.
 */
std::string caption_text(const std::string &text, size_t index);

/// Remove characters that break an ffmpeg drawtext argument
std::string sanitize_overlay_text(const std::string &text);

/**
 * @brief Group words into subtitle lines of at most CAPTION_LINE_CHARS.
 * @param clip_start Absolute start time of the clip
 */
std::vector<Caption> build_captions(const std::vector<Word> &words,
                                    double clip_start);

/// HH:MM:SS,mmm
std::string format_srt_time(double seconds);

std::string format_srt(const std::vector<Caption> &captions);

/// @return false if the file cannot be written
bool write_srt(const std::string &path, const std::vector<Caption> &captions);

/**
 * @brief The -vf chain for the vertical layout.
 * @param overlays false for the plain scale/pad fallback
 */
std::string build_vertical_filter(const RenderOptions &options,
                                  const std::string &title,
                                  const std::string &caption, bool overlays);

/**
 * @class ClipRenderer
 * @brief Runs ffmpeg once per highlight (twice when overlays fail).
 */
class ClipRenderer {
public:
  explicit ClipRenderer(RenderOptions options);

  /**
   * @brief Render every highlight into out_dir as short_N.mp4 / short_N.srt.
   * @return Paths of the clips that were written
   */
  std::vector<std::string> render(const std::string &video,
                                  const std::vector<Highlight> &highlights,
                                  const Transcript &transcript,
                                  const std::string &out_dir) const;

  const RenderOptions &options() const { return options_; }

private:
  bool extract_clip(const std::string &video, double start, double duration,
                    const std::string &out) const;
  bool format_vertical(const std::string &raw, const std::string &out,
                       const std::string &title,
                       const std::string &caption) const;

  RenderOptions options_;
};

} // namespace shortsmith

#endif // SHORTSMITH_CLIP_RENDERER_HPP
