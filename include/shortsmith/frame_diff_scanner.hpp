/**
 * @file frame_diff_scanner.hpp
 * @brief Decodes video and measures dissimilarity between sampled frames
 *
 * @details The FrameDiffScanner decodes a video file, downsamples every
 *          sampled frame to a small grayscale thumbnail and reports the mean
 *          absolute pixel difference to the previous sample. The resulting
 *          FrameDiffSignal feeds the SceneSegmenter.
 *
 * @attention THREAD MODEL:
 *            - Each worker thread creates its own FrameDiffScanner instance.
 *
 *            - FFmpeg decoder state is not thread-safe.
 */

#ifndef SHORTSMITH_FRAME_DIFF_SCANNER_HPP
#define SHORTSMITH_FRAME_DIFF_SCANNER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

namespace shortsmith {

/**
 * @brief Frames between consecutive samples for a given stream rate.
 * @return max(1, floor(video_fps / sample_fps)); 1 when sample_fps <= 0
 */
int sample_step(double video_fps, double sample_fps);

/**
 * @brief Mean absolute difference of two equally sized grayscale buffers,
 *        normalized to [0,1].
 */
double mean_abs_diff(const std::vector<uint8_t> &a,
                     const std::vector<uint8_t> &b);

/**
 * @class FrameDiffScanner
 * @brief Per-thread decoder producing frame-difference samples.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 *
 * `SAMPLES`:
 *
 *            - Sample k is the first decoded frame at or after frame index
 *              k * step; it is reported under the nominal index k * step
 */
class FrameDiffScanner {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  SwsContext *sws_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;

  std::string path_;

  /// Thumbnail buffers reused across samples
  std::vector<uint8_t> previous;
  std::vector<uint8_t> current;

  /// Convert the decoded frame into `current`
  bool to_thumbnail(const AVFrame *f);

  /// Frame index of a decoded frame from its timestamp
  int64_t frame_index_of(const AVFrame *f) const;

public:
  explicit FrameDiffScanner(std::string path);
  ~FrameDiffScanner();

  FrameDiffScanner(const FrameDiffScanner &) = delete;
  FrameDiffScanner &operator=(const FrameDiffScanner &) = delete;

  /**
   * @brief Open the container and the video decoder.
   * @return true on success, false on failure (details are logged)
   */
  bool initialize();

  double get_duration() const;
  double get_fps() const;

  /**
   * @brief Total frame count; estimated from duration when the container
   *        does not record it.
   */
  int64_t get_frame_count() const;

  /**
   * @brief Scan samples [first_sample, last_sample).
   *
   * @details Seeks near sample first_sample - 1, decodes it as the
   *          reference, then emits one difference per sample. Sample 0 has
   *          no predecessor and produces no entry.
   *
   * @param step Frames between samples (see sample_step())
   * @param decode_us Output: accumulated decode time in microseconds
   */
  std::vector<FrameDiffSample> scan_range(int64_t first_sample,
                                          int64_t last_sample, int step,
                                          long &decode_us);
};

/**
 * @brief Scan a whole file with a pool of workers.
 *
 * @param path Video file
 * @param sample_fps Target sampling rate (<= 0 samples every frame)
 * @param num_threads Worker count (0 = auto)
 * @param chunk_sec Seconds of video per work item
 * @throws MediaError when the file cannot be opened or a chunk fails
 */
FrameDiffSignal scan_frame_differences(const std::string &path,
                                       double sample_fps, int num_threads,
                                       double chunk_sec);

} // namespace shortsmith

#endif // SHORTSMITH_FRAME_DIFF_SCANNER_HPP
