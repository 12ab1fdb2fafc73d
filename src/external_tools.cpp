/**
 * @file external_tools.cpp
 * @brief yt-dlp and whisper invocation
 */

#include "shortsmith/external_tools.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "shortsmith/logging.hpp"
#include "shortsmith/system.hpp"

namespace fs = std::filesystem;

namespace shortsmith {

std::string build_download_command(const std::string &url,
                                   const std::string &output,
                                   const std::string &cookies) {
  std::string cmd =
      "yt-dlp --no-playlist "
      "-f \"bestvideo[ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best\" "
      "--merge-output-format mp4";
  if (!cookies.empty())
    cmd += " --cookies " + shell_quote(cookies);
  cmd += fmt::format(" -o {} {}", shell_quote(output), shell_quote(url));
  return cmd;
}

std::string acquire_video(const std::string &source, const std::string &output,
                          const std::string &cookies) {
  std::error_code ec;
  if (fs::is_regular_file(source, ec)) {
    LOG_INFO("Using local video: {}", source);
    return source;
  }

  std::string cookie_arg;
  if (!cookies.empty() && fs::is_regular_file(cookies, ec)) {
    cookie_arg = cookies;
  } else if (!cookies.empty()) {
    LOG_WARN("Cookies file not found: {} (downloading without cookies)",
             cookies);
  }

  std::string cmd = build_download_command(source, output, cookie_arg);
  LOG_DEBUG("{}", cmd);

  int status = run_command(cmd);
  if (status != 0) {
    LOG_ERROR("yt-dlp failed with status {}", status);
    return "";
  }
  if (!fs::is_regular_file(output, ec)) {
    LOG_ERROR("yt-dlp finished but {} is missing", output);
    return "";
  }
  return output;
}

std::string build_whisper_command(const std::string &video,
                                  const std::string &out_dir,
                                  const std::string &model,
                                  const std::string &language) {
  std::string cmd = fmt::format(
      "whisper {} --model {} --output_dir {} --output_format json "
      "--word_timestamps True --verbose False",
      shell_quote(video), shell_quote(model), shell_quote(out_dir));
  if (!language.empty())
    cmd += " --language " + shell_quote(language);
  return cmd;
}

std::string transcribe_with_whisper(const std::string &video,
                                    const std::string &out_dir,
                                    const std::string &model,
                                    const std::string &language) {
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create {}: {}", out_dir, ec.message());
    return "";
  }

  int status = run_command(build_whisper_command(video, out_dir, model,
                                                 language));
  if (status != 0) {
    LOG_ERROR("whisper failed with status {}", status);
    return "";
  }

  /// whisper names its output after the input stem
  fs::path json_path =
      fs::path(out_dir) / (fs::path(video).stem().string() + ".json");
  if (!fs::is_regular_file(json_path, ec)) {
    LOG_ERROR("whisper finished but {} is missing", json_path.string());
    return "";
  }
  return json_path.string();
}

} // namespace shortsmith
