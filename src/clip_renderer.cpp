/**
 * @file clip_renderer.cpp
 * @brief Vertical short rendering with ffmpeg and SRT output
 */

#include "shortsmith/clip_renderer.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"
#include "shortsmith/system.hpp"

namespace fs = std::filesystem;

namespace shortsmith {

namespace {

const char *const STOCK_CAPTIONS[] = {
    "Watch this amazing highlight!", "Don't miss this key moment!",
    "This is worth watching!", "Check this out!", "Important point here!"};

/// Word characters of a UTF-8 string (multi-byte sequences count as words)
bool is_word_byte(unsigned char c) {
  return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string to_upper(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string w;
  while (in >> w)
    words.push_back(w);
  return words;
}

std::string join_words(const std::vector<std::string> &words, size_t n) {
  std::string out;
  for (size_t i = 0; i < n && i < words.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += words[i];
  }
  return out;
}

} // namespace

// **---- TEXT ----**

int target_height_for(const std::string &aspect_ratio, int width) {
  auto colon = aspect_ratio.find(':');
  if (colon == std::string::npos || width <= 0)
    throw InvalidInputError("Invalid aspect ratio: " + aspect_ratio);
  int w = 0, h = 0;
  try {
    w = std::stoi(aspect_ratio.substr(0, colon));
    h = std::stoi(aspect_ratio.substr(colon + 1));
  } catch (const std::exception &) {
    throw InvalidInputError("Invalid aspect ratio: " + aspect_ratio);
  }
  if (w <= 0 || h <= 0)
    throw InvalidInputError("Invalid aspect ratio: " + aspect_ratio);
  return static_cast<int>(static_cast<double>(width) * h / w);
}

std::string generate_title(const std::string &text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (char c : text) {
    auto uc = static_cast<unsigned char>(c);
    if (is_word_byte(uc) || std::isspace(uc))
      cleaned += c;
  }

  if (cleaned.size() < 30)
    return to_upper(cleaned);

  auto words = split_words(cleaned);
  if (words.size() > 5)
    return to_upper(join_words(words, 5) + "...");
  return to_upper(cleaned);
}

std::string caption_text(const std::string &text, size_t index) {
  if (text.size() <= 10)
    return STOCK_CAPTIONS[index % (sizeof(STOCK_CAPTIONS) /
                                   sizeof(STOCK_CAPTIONS[0]))];

  auto words = split_words(text);
  if (words.size() <= 5)
    return text;
  std::string out = join_words(words, 12);
  if (words.size() > 12)
    out += "...";
  return out;
}

std::string sanitize_overlay_text(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\'' || c == '"' || c == ',' || c == ':' || c == '\\' ||
        c == '%')
      continue;
    out += c;
  }
  return out;
}

// **---- SUBTITLES ----**

std::vector<Caption> build_captions(const std::vector<Word> &words,
                                    double clip_start) {
  std::vector<Caption> captions;
  if (words.empty())
    return captions;

  std::string line;
  double line_start = words.front().start;

  for (const auto &w : words) {
    if (!line.empty() && line.size() + 1 + w.text.size() > CAPTION_LINE_CHARS) {
      captions.push_back({line_start - clip_start, w.start - clip_start, line});
      line = w.text;
      line_start = w.start;
    } else if (line.empty()) {
      line = w.text;
      line_start = w.start;
    } else {
      line += ' ';
      line += w.text;
    }
  }

  if (!line.empty())
    captions.push_back(
        {line_start - clip_start, words.back().end - clip_start, line});
  return captions;
}

std::string format_srt_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int hours = static_cast<int>(seconds / 3600);
  int minutes = static_cast<int>(std::fmod(seconds, 3600.0) / 60);
  double secs = std::fmod(seconds, 60.0);
  int millis = static_cast<int>((secs - std::floor(secs)) * 1000);
  return fmt::format("{:02d}:{:02d}:{:02d},{:03d}", hours, minutes,
                     static_cast<int>(secs), millis);
}

std::string format_srt(const std::vector<Caption> &captions) {
  std::string out;
  for (size_t i = 0; i < captions.size(); ++i) {
    out += fmt::format("{}\n{} --> {}\n{}\n\n", i + 1,
                       format_srt_time(captions[i].start),
                       format_srt_time(captions[i].end), captions[i].text);
  }
  return out;
}

bool write_srt(const std::string &path, const std::vector<Caption> &captions) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    return false;
  out << format_srt(captions);
  return static_cast<bool>(out);
}

// **---- FFMPEG ----**

std::string build_vertical_filter(const RenderOptions &options,
                                  const std::string &title,
                                  const std::string &caption, bool overlays) {
  const int w = options.target_width;
  const int h = options.target_height;
  std::string vf = fmt::format("scale={0}:{1}:force_original_aspect_ratio="
                               "decrease,pad={0}:{1}:(ow-iw)/2:(oh-ih)/2",
                               w, h);
  if (!overlays)
    return vf;

  vf += fmt::format(",drawbox=x=0:y=0:w={}:h=120:color=black@0.8:t=fill", w);
  vf += fmt::format(",drawtext=text='{}':fontsize=48:fontcolor=white:"
                    "x=(w-text_w)/2:y=60-th/2",
                    title);
  vf += fmt::format(",drawbox=x=0:y=h-120:w={}:h=120:color=black@0.8:t=fill",
                    w);
  vf += fmt::format(",drawtext=text='{}':fontsize=36:fontcolor=white:"
                    "x=(w-text_w)/2:y=h-60-th/2",
                    caption);
  return vf;
}

ClipRenderer::ClipRenderer(RenderOptions options)
    : options_(std::move(options)) {}

bool ClipRenderer::extract_clip(const std::string &video, double start,
                                double duration, const std::string &out) const {
  std::string cmd = fmt::format(
      "{} -y -hide_banner -loglevel error -ss {:.3f} -i {} -t {:.3f} "
      "-c:v libx264 -c:a aac {}",
      options_.ffmpeg, start, shell_quote(video), duration, shell_quote(out));
  int status = run_command(cmd);
  if (status != 0) {
    LOG_ERROR("FFmpeg extract failed with status {}", status);
    return false;
  }
  return true;
}

bool ClipRenderer::format_vertical(const std::string &raw,
                                   const std::string &out,
                                   const std::string &title,
                                   const std::string &caption) const {
  for (bool overlays : {true, false}) {
    std::string cmd = fmt::format(
        "{} -y -hide_banner -loglevel error -i {} -vf {} "
        "-c:v libx264 -preset medium -crf 23 -c:a aac -b:a 128k {}",
        options_.ffmpeg, shell_quote(raw),
        shell_quote(build_vertical_filter(options_, title, caption, overlays)),
        shell_quote(out));
    int status = run_command(cmd);
    if (status == 0) {
      if (!overlays)
        LOG_WARN("Created {} without overlays",
                 fs::path(out).filename().string());
      return true;
    }
    LOG_WARN("FFmpeg vertical format failed with status {}{}", status,
             overlays ? ", retrying without overlays" : "");
  }
  return false;
}

std::vector<std::string>
ClipRenderer::render(const std::string &video,
                     const std::vector<Highlight> &highlights,
                     const Transcript &transcript,
                     const std::string &out_dir) const {
  std::vector<std::string> written;

  std::error_code ec;
  fs::path work_dir = fs::path(out_dir) / ".work";
  fs::create_directories(work_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create {}: {}", work_dir.string(), ec.message());
    return written;
  }

  LOG_INFO("Rendering at {}x{}", options_.target_width,
           options_.target_height);

  for (size_t i = 0; i < highlights.size(); ++i) {
    const Highlight &hl = highlights[i];
    const size_t n = i + 1;
    double duration = hl.duration();

    if (duration < options_.min_duration) {
      LOG_WARN("Skipping highlight {} - too short ({:.2f}s < {:.2f}s)", n,
               duration, options_.min_duration);
      continue;
    }
    if (duration > options_.max_duration) {
      LOG_INFO("Trimming highlight {} - too long ({:.2f}s > {:.2f}s)", n,
               duration, options_.max_duration);
      duration = options_.max_duration;
    }

    std::string raw = (work_dir / fmt::format("raw_clip_{}.mp4", n)).string();
    std::string out =
        (fs::path(out_dir) / fmt::format("short_{}.mp4", n)).string();
    std::string srt =
        (fs::path(out_dir) / fmt::format("short_{}.srt", n)).string();

    TIMER_START(render_clip);
    if (!extract_clip(video, hl.start_time, duration, raw))
      continue;

    std::string title = sanitize_overlay_text(generate_title(hl.text));
    if (title.empty())
      title = fmt::format("HIGHLIGHT {}", n);
    std::string caption = sanitize_overlay_text(caption_text(hl.text, i));

    if (!format_vertical(raw, out, title, caption)) {
      LOG_ERROR("Failed to render highlight {}", n);
      continue;
    }
    TIMER_END(render_clip);

    auto captions = build_captions(
        transcript.words_in_range(hl.start_time, hl.start_time + duration),
        hl.start_time);
    if (!write_srt(srt, captions))
      LOG_WARN("Failed to write {}", srt);

    LOG_SUCCESS("Created short {}: {}", n, out);
    written.push_back(out);
  }

  fs::remove_all(work_dir, ec);
  return written;
}

} // namespace shortsmith
