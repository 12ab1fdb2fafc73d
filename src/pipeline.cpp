/**
 * @file pipeline.cpp
 * @brief End-to-end shorts generation implementation
 *
 * @details Stage failures surface as shortsmith::Error and are reported once
 *          by run(); collaborators that shell out report failure with an
 *          empty path.
 */

#include "shortsmith/pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "shortsmith/clip_renderer.hpp"
#include "shortsmith/config.hpp"
#include "shortsmith/errors.hpp"
#include "shortsmith/external_tools.hpp"
#include "shortsmith/frame_diff_scanner.hpp"
#include "shortsmith/highlight_selector.hpp"
#include "shortsmith/logging.hpp"
#include "shortsmith/scene_merger.hpp"
#include "shortsmith/scene_segmenter.hpp"
#include "shortsmith/system.hpp"
#include "shortsmith/text_scorer.hpp"

namespace fs = std::filesystem;

namespace shortsmith {

// **---- Constructor ----**

ShortsPipeline::ShortsPipeline(std::string source, std::string out_dir,
                               std::string transcript_path)
    : source_(std::move(source)), out_dir_(std::move(out_dir)),
      transcript_path_(std::move(transcript_path)) {}

// **---- Main Processing ----**

int ShortsPipeline::run() {
  try {
    return run_stages();
  } catch (const InvalidInputError &e) {
    LOG_ERROR("Invalid input: {}", e.what());
  } catch (const MediaError &e) {
    LOG_ERROR("Media error: {}", e.what());
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
  }
  return 1;
}

int ShortsPipeline::run_stages() {
  TimingCollector::clear();
  TIMER_START(total_run);

  EngineConfig config = EngineConfig::from_env();
  config.validate();

  std::error_code ec;
  fs::create_directories(out_dir_, ec);
  if (ec)
    throw Error(fmt::format("Cannot create {}: {}", out_dir_, ec.message()));

  // **----- PHASE 1: ACQUIRE -----**

  LOG_PHASE("[1/7] Acquiring video...");
  TIMER_START(acquire);
  video_path_ = acquire_video(
      source_, (fs::path(out_dir_) / "input.mp4").string(),
      Config::cookies_path());
  TIMER_END(acquire);
  if (video_path_.empty())
    throw MediaError("Download failed: " + source_);

  // **----- PHASE 2: TRANSCRIBE -----**

  LOG_PHASE("[2/7] Transcribing video...");
  TIMER_START(transcribe);
  std::string json_path = transcript_path_;
  if (json_path.empty()) {
    json_path = transcribe_with_whisper(
        video_path_, (fs::path(out_dir_) / "transcript").string(),
        Config::whisper_model(), Config::language());
    if (json_path.empty())
      throw Error("Transcription failed");
  }
  if (!load_transcript(json_path, transcript_))
    throw Error("Cannot load transcript: " + json_path);
  TIMER_END(transcribe);

  auto spans = speech_spans(transcript_);
  LOG_INFO("Transcribed {} words", transcript_.words.size());
  LOG_INFO("Identified {} potential segments", spans.size());
  if (transcript_.empty())
    LOG_WARN("Transcript is empty; highlights will score on visuals only");

  // **----- PHASE 3: FRAME DIFFERENCES -----**

  LOG_PHASE("[3/7] Scanning frame differences...");
  FrameDiffSignal signal =
      scan_frame_differences(video_path_, Config::sample_fps(),
                             Config::scan_threads(), Config::scan_chunk_sec());

  // **----- PHASE 4: SCENES -----**

  LOG_PHASE("[4/7] Detecting scenes...");
  TIMER_START(scenes);
  SceneSegmenter segmenter(config.min_scene_len, config.scene_threshold);
  scenes_ = merge_short_scenes(segmenter.detect_scenes(signal, spans),
                               config.merge_min_duration);
  TIMER_END(scenes);
  print_scene_stats();

  if (scenes_.empty()) {
    LOG_WARN("No scenes detected.");
    TIMER_END(total_run);
    TimingCollector::print_summary();
    return 0;
  }

  // **----- PHASE 5: HIGHLIGHTS -----**

  LOG_PHASE("[5/7] Selecting highlights...");
  TIMER_START(select);
  HighlightSelector selector(
      config, make_text_scorer(config.keywords, ScorerConfig::from_env()));
  highlights_ = selector.select(scenes_, transcript_.words);
  TIMER_END(select);
  print_highlights();

  // **----- PHASE 6: RENDER -----**

  LOG_PHASE("[6/7] Generating highlight clips in vertical format...");
  RenderOptions options;
  options.target_width = Config::target_width();
  options.target_height =
      target_height_for(Config::aspect_ratio(), options.target_width);
  options.min_duration = config.min_duration;
  options.max_duration = config.max_duration;
  options.ffmpeg = Config::ffmpeg_bin();

  TIMER_START(render);
  ClipRenderer renderer(options);
  rendered_ = renderer.render(video_path_, highlights_, transcript_, out_dir_);
  TIMER_END(render);

  // **----- PHASE 7: SUMMARY -----**

  TIMER_END(total_run);
  TimingCollector::print_summary();
  print_summary();
  return 0;
}

// **---- Reporting ----**

void ShortsPipeline::print_scene_stats() const {
  LOG_INFO("Detected {} scenes after merging", scenes_.size());
  if (scenes_.empty())
    return;

  double total = 0;
  size_t with_speech = 0;
  for (const auto &s : scenes_) {
    total += s.duration();
    if (s.has_speech())
      ++with_speech;
  }
  LOG_INFO("Average scene duration: {:.2f} seconds", total / scenes_.size());
  LOG_INFO("Scenes with speech: {} ({:.1f}%)", with_speech,
           100.0 * with_speech / scenes_.size());
}

void ShortsPipeline::print_highlights() const {
  LOG_INFO("Selected {} highlights", highlights_.size());
  for (size_t i = 0; i < highlights_.size(); ++i) {
    const Highlight &hl = highlights_[i];
    LOG_INFO("Highlight {}/{}: {:.1f}s - {:.1f}s ({:.1f}s) score {:.2f}, "
             "speech density {:.2f}",
             i + 1, highlights_.size(), hl.start_time, hl.end_time,
             hl.duration(), hl.score, hl.anchor(scenes_).speech_density());
    if (hl.text.size() > 100) {
      LOG_INFO("  Text: {}...", hl.text.substr(0, 100));
    } else {
      LOG_INFO("  Text: {}", hl.text);
    }
  }
}

void ShortsPipeline::print_summary() const {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= SHORTS SUMMARY =================\n");
  fmt::print("{:<20} {:>15}\n", "Source:", fs::path(video_path_).filename().string());
  fmt::print("{:<20} {:>15}\n", "Scenes:", scenes_.size());
  fmt::print("{:<20} {:>15}\n", "Highlights:", highlights_.size());
  fmt::print("{:<20} {:>15}\n", "Shorts written:", rendered_.size());
  fmt::print("{:<20} {:>15}\n", "Output:",
             fs::absolute(out_dir_).string());
  fmt::print(fg(fmt::color::cyan),
             "==================================================\n");
}

} // namespace shortsmith
