/**
 * @file external_tools.hpp
 * @brief Runners for the command-line tools around the engine
 *
 * @details yt-dlp fetches remote sources, the whisper CLI produces the word
 *          timestamped transcript. Both are invoked through run_command()
 *          and report failure with an empty path.
 */

#ifndef SHORTSMITH_EXTERNAL_TOOLS_HPP
#define SHORTSMITH_EXTERNAL_TOOLS_HPP

#include <string>

namespace shortsmith {

/**
 * @brief Resolve a source to a local video file.
 *
 * @param source Existing file path or URL
 * @param output Download destination (used only for URLs)
 * @param cookies Browser cookies for yt-dlp (ignored when the file is missing)
 * @return Local path, or "" on failure
 */
std::string acquire_video(const std::string &source, const std::string &output,
                          const std::string &cookies);

/// yt-dlp command line for a download
std::string build_download_command(const std::string &url,
                                   const std::string &output,
                                   const std::string &cookies);

/**
 * @brief Transcribe a video with the whisper CLI.
 *
 * @param language Language hint ("" = auto-detect)
 * @return Path of the JSON transcript, or "" on failure
 */
std::string transcribe_with_whisper(const std::string &video,
                                    const std::string &out_dir,
                                    const std::string &model,
                                    const std::string &language);

/// whisper command line for a transcription
std::string build_whisper_command(const std::string &video,
                                  const std::string &out_dir,
                                  const std::string &model,
                                  const std::string &language);

} // namespace shortsmith

#endif // SHORTSMITH_EXTERNAL_TOOLS_HPP
