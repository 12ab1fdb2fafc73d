/**
 * @file main.cpp
 * @brief Entry point for the shortsmith application
 *
 * @details Handles:
 *
 *          - Loading an optional .env file from the working directory
 *
 *          - Command-line argument parsing
 *
 *          - Running the ShortsPipeline once
 */

#include <cstdio>
#include <string>

#include "shortsmith/config.hpp"
#include "shortsmith/logging.hpp"
#include "shortsmith/pipeline.hpp"

using namespace shortsmith;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 3 || argc > 4) {
    LOG_WARN("Usage: ./shortsmith <video-or-url> <output-dir> "
             "[transcript.json]");
    return 1;
  }

  /// Variables already in the environment win over .env
  int loaded = Config::load_env_file(".env");
  if (loaded > 0)
    LOG_INFO("Loaded {} settings from .env", loaded);

  std::string source = argv[1];
  std::string out_dir = argv[2];
  std::string transcript = (argc == 4) ? argv[3] : "";

  LOG_INFO("Shortsmith");
  LOG_INFO("Source: {}", source);
  LOG_INFO("Output: {}", out_dir);

  ShortsPipeline app(source, out_dir, transcript);
  return app.run();
}
