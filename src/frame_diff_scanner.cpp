/**
 * @file frame_diff_scanner.cpp
 * @brief Frame-difference scanning implementation
 *
 * @details Each sampled frame is scaled to a DIFF_FRAME_WIDTH x
 *          DIFF_FRAME_HEIGHT GRAY8 thumbnail with swscale and compared to
 *          the previous sample by mean absolute difference.
 *
 * @attention OPTIMIZATIONS:
 *
 *          - Thumbnail buffers pre-allocated (no malloc in hot loop)
 *
 *          - Chroma decoding skipped (AV_CODEC_FLAG_GRAY)
 *
 *          - Work split into sample chunks shared through a TaskQueue
 */

#include "shortsmith/frame_diff_scanner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"
#include "shortsmith/system.hpp"
#include "shortsmith/task_queue.hpp"

namespace shortsmith {

namespace {
constexpr size_t THUMB_SIZE =
    static_cast<size_t>(DIFF_FRAME_WIDTH) * DIFF_FRAME_HEIGHT;
}

int sample_step(double video_fps, double sample_fps) {
  if (sample_fps <= 0 || video_fps <= 0)
    return 1;
  return std::max(1, static_cast<int>(video_fps / sample_fps));
}

double mean_abs_diff(const std::vector<uint8_t> &a,
                     const std::vector<uint8_t> &b) {
  const size_t n = std::min(a.size(), b.size());
  if (n == 0)
    return 0.0;
  uint64_t total = 0;
  for (size_t i = 0; i < n; ++i)
    total += static_cast<uint64_t>(std::abs(int(a[i]) - int(b[i])));
  return static_cast<double>(total) / static_cast<double>(n) / 255.0;
}

// **----- FrameDiffScanner -----**

FrameDiffScanner::FrameDiffScanner(std::string path) : path_(std::move(path)) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
  previous.resize(THUMB_SIZE);
  current.resize(THUMB_SIZE);
}

FrameDiffScanner::~FrameDiffScanner() {
  if (sws_ctx)
    sws_freeContext(sws_ctx);
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_frame_free(&frame);
  av_packet_free(&pkt);
}

bool FrameDiffScanner::initialize() {
  if (!frame || !pkt) {
    LOG_ERROR("Failed to allocate frame/packet");
    return false;
  }

  if (avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("avformat_open_input failed: {}", path_);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed: {}", path_);
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("No video stream found in {}", path_);
    return false;
  }

  /// Discard non-video streams
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx))
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
  }

  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder found for codec ID {}", (int)param->codec_id);
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  if (avcodec_parameters_to_context(dec_ctx, param) < 0) {
    LOG_ERROR("avcodec_parameters_to_context failed");
    return false;
  }

  // **--- DECODER OPTIMIZATIONS ---**

  /// Only luma is needed for a grayscale thumbnail
  dec_ctx->flags |= AV_CODEC_FLAG_GRAY;
  dec_ctx->flags2 |= AV_CODEC_FLAG2_FAST;

  /// Single-threaded decoding (we parallelize at chunk level instead)
  dec_ctx->thread_count = 1;

  if (avcodec_open2(dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("avcodec_open2 failed");
    return false;
  }
  return true;
}

double FrameDiffScanner::get_duration() const {
  if (fmt_ctx && fmt_ctx->duration != AV_NOPTS_VALUE)
    return fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);
  if (fmt_ctx && video_stream_idx >= 0) {
    const AVStream *st = fmt_ctx->streams[video_stream_idx];
    if (st->duration != AV_NOPTS_VALUE)
      return st->duration * av_q2d(st->time_base);
  }
  return 0.0;
}

double FrameDiffScanner::get_fps() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return 0.0;
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  AVRational r = st->avg_frame_rate;
  if (r.num <= 0 || r.den <= 0)
    r = st->r_frame_rate;
  return (r.num > 0 && r.den > 0) ? av_q2d(r) : 0.0;
}

int64_t FrameDiffScanner::get_frame_count() const {
  if (!fmt_ctx || video_stream_idx < 0)
    return 0;
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  if (st->nb_frames > 0)
    return st->nb_frames;
  return static_cast<int64_t>(std::llround(get_duration() * get_fps()));
}

int64_t FrameDiffScanner::frame_index_of(const AVFrame *f) const {
  int64_t ts = f->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE)
    ts = f->pts;
  if (ts == AV_NOPTS_VALUE)
    return -1;
  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  if (st->start_time != AV_NOPTS_VALUE)
    ts -= st->start_time;
  return static_cast<int64_t>(
      std::llround(ts * av_q2d(st->time_base) * get_fps()));
}

bool FrameDiffScanner::to_thumbnail(const AVFrame *f) {
  sws_ctx = sws_getCachedContext(
      sws_ctx, f->width, f->height, static_cast<AVPixelFormat>(f->format),
      DIFF_FRAME_WIDTH, DIFF_FRAME_HEIGHT, AV_PIX_FMT_GRAY8, SWS_AREA, nullptr,
      nullptr, nullptr);
  if (!sws_ctx)
    return false;

  uint8_t *dst[4] = {current.data(), nullptr, nullptr, nullptr};
  int dst_stride[4] = {DIFF_FRAME_WIDTH, 0, 0, 0};
  return sws_scale(sws_ctx, f->data, f->linesize, 0, f->height, dst,
                   dst_stride) == DIFF_FRAME_HEIGHT;
}

std::vector<FrameDiffSample>
FrameDiffScanner::scan_range(int64_t first_sample, int64_t last_sample,
                             int step, long &decode_us) {
  std::vector<FrameDiffSample> out;
  if (last_sample <= first_sample)
    return out;
  out.reserve(static_cast<size_t>(last_sample - first_sample));

  const AVStream *st = fmt_ctx->streams[video_stream_idx];
  const double fps = get_fps();

  /// Start one sample early so the first sample of the chunk has a reference
  int64_t k = first_sample > 0 ? first_sample - 1 : 0;
  bool have_reference = false;
  int64_t untimed_index = k * step - 1;

  if (fps > 0) {
    double seconds = (k * step) / fps;
    int64_t seek_ts = static_cast<int64_t>(seconds / av_q2d(st->time_base));
    if (st->start_time != AV_NOPTS_VALUE)
      seek_ts += st->start_time;
    if (av_seek_frame(fmt_ctx, video_stream_idx, seek_ts,
                      AVSEEK_FLAG_BACKWARD) < 0) {
      LOG_WARN("Seek to {:.2f}s failed, decoding from current position",
               seconds);
    }
    avcodec_flush_buffers(dec_ctx);
  }

  /// Consume one decoded frame; returns true once the range is complete
  auto consume = [&](const AVFrame *f) -> bool {
    int64_t idx = frame_index_of(f);
    if (idx < 0)
      idx = ++untimed_index;
    if (idx < k * step)
      return false;
    if (!to_thumbnail(f)) {
      LOG_WARN("Thumbnail conversion failed at frame {}", idx);
      return false;
    }
    if (have_reference && k >= first_sample)
      out.push_back({k * step, mean_abs_diff(previous, current)});
    std::swap(previous, current);
    have_reference = true;
    return ++k >= last_sample;
  };

  auto receive_all = [&]() -> bool {
    while (true) {
      auto t0 = std::chrono::steady_clock::now();
      int ret = avcodec_receive_frame(dec_ctx, frame);
      decode_us += std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::steady_clock::now() - t0)
                       .count();
      if (ret < 0)
        return false;
      bool done = consume(frame);
      av_frame_unref(frame);
      if (done)
        return true;
    }
  };

  // **----- DECODE + DIFF LOOP -----**

  while (av_read_frame(fmt_ctx, pkt) >= 0) {
    if (pkt->stream_index == video_stream_idx) {
      auto t0 = std::chrono::steady_clock::now();
      int send_ret = avcodec_send_packet(dec_ctx, pkt);
      decode_us += std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::steady_clock::now() - t0)
                       .count();
      if (send_ret >= 0 && receive_all()) {
        av_packet_unref(pkt);
        return out;
      }
    }
    av_packet_unref(pkt);
  }

  /// Drain frames still buffered in the decoder
  if (avcodec_send_packet(dec_ctx, nullptr) >= 0)
    receive_all();

  return out;
}

// **----- PARALLEL SCAN -----**

FrameDiffSignal scan_frame_differences(const std::string &path,
                                       double sample_fps, int num_threads,
                                       double chunk_sec) {
  FrameDiffSignal signal;
  {
    TIMER_START(probe);
    FrameDiffScanner probe(path);
    if (!probe.initialize())
      throw MediaError("Cannot open video: " + path);
    signal.fps = probe.get_fps();
    signal.frame_count = probe.get_frame_count();
    TIMER_END(probe);
  }

  if (signal.fps <= 0)
    throw MediaError("Video has no usable frame rate: " + path);
  if (signal.frame_count <= 0) {
    LOG_WARN("Video reports no frames: {}", path);
    return signal;
  }

  LOG_INFO("Duration: {} ({} frames @ {:.1f}fps)",
           format_time(signal.duration()), signal.frame_count, signal.fps);

  const int step = sample_step(signal.fps, sample_fps);
  const int64_t total_samples = (signal.frame_count + step - 1) / step;
  const int64_t chunk_samples = std::max<int64_t>(
      1, static_cast<int64_t>(chunk_sec > 0 ? chunk_sec * signal.fps / step
                                            : total_samples));

  TaskQueue task_queue;
  ResultCollector results;
  results.reserve(static_cast<size_t>(total_samples));

  int chunk_id = 0;
  for (int64_t s = 0; s < total_samples; s += chunk_samples)
    task_queue.push({s, std::min(s + chunk_samples, total_samples), chunk_id++});

  const int threads = resolve_worker_count(num_threads, chunk_id);
  LOG_PHASE("Scanning frame differences ({} threads, {} chunks, step {})...",
            threads, chunk_id, step);

  TIMER_START(frame_scan);

  std::atomic<int> chunks_done{0};
  std::atomic<long> total_decode_us{0};
  std::vector<std::thread> workers;

  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&path, step, &task_queue, &results, &chunks_done,
                          &total_decode_us]() {
      FrameDiffScanner scanner(path);
      if (!scanner.initialize())
        return;

      long local_decode_us = 0;
      int local_chunks = 0;

      ScanTask task;
      while (task_queue.pop(task)) {
        auto chunk = scanner.scan_range(task.first_sample, task.last_sample,
                                        step, local_decode_us);
        LOG_DEBUG("Chunk {} produced {} samples", task.id, chunk.size());
        if (!chunk.empty())
          results.add(std::move(chunk));
        ++local_chunks;
      }

      chunks_done += local_chunks;
      total_decode_us += local_decode_us;
    });
  }

  task_queue.finish();
  for (auto &w : workers)
    w.join();

  TIMER_END(frame_scan);
  TimingCollector::record("decode (sum)", total_decode_us.load());

  if (chunks_done.load() < chunk_id) {
    throw MediaError(fmt::format("Frame scan incomplete: {} of {} chunks",
                                 chunks_done.load(), chunk_id));
  }

  signal.samples = results.extract();
  LOG_INFO("Collected {} frame-difference samples", signal.samples.size());
  return signal;
}

} // namespace shortsmith
