/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          the EngineConfig / ScorerConfig aggregates handed to the engine.
 *          See config/shortsmith.env for documentation of each parameter.
 */

#ifndef SHORTSMITH_CONFIG_HPP
#define SHORTSMITH_CONFIG_HPP

#include <cstdlib>
#include <string>
#include <vector>

namespace shortsmith {
namespace Config {

inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Split a comma-separated list, trimming whitespace and dropping empty
 *        items.
 */
std::vector<std::string> split_list(const std::string &text);

/**
 * @brief Get a comma-separated list from an environment variable.
 * @return Parsed list, or default_val when the variable is unset
 */
std::vector<std::string>
get_env_list(const char *name, const std::vector<std::string> &default_val);

/**
 * @brief Export KEY=VALUE pairs from a dotenv file.
 * @note Keys already present in the environment are left untouched. Lines
 *       starting with '#' and blank lines are skipped; values may be wrapped
 *       in single or double quotes.
 * @return Number of variables exported, or -1 if the file cannot be read
 */
int load_env_file(const std::string &path);

// **---- SCENE DETECTION ----**

/// Minimum scene length in seconds at detection time
inline double min_scene_len() {
  static double val = get_env_double("MIN_SCENE_LEN", 0.5);
  return val;
}

/// Boundary threshold in the 0-255 pixel unit
inline double scene_threshold() {
  static double val = get_env_double("SCENE_THRESHOLD", 27.0);
  return val;
}

/// Scenes shorter than this are fused with a neighbour
inline double scene_merge_min_sec() {
  static double val = get_env_double("SCENE_MERGE_MIN_SEC", 1.0);
  return val;
}

/// Frame-difference samples per second of video
inline double sample_fps() {
  static double val = get_env_double("SAMPLE_FPS", 1.0);
  return val;
}

/// Frame-difference worker threads (0 = auto)
inline int scan_threads() {
  static int val = get_env_int("SCAN_THREADS", 0);
  return val;
}

/// Seconds of video per scan work unit
inline double scan_chunk_sec() {
  static double val = get_env_double("SCAN_CHUNK_SEC", 120.0);
  return val;
}

// **---- HIGHLIGHT SELECTION ----**

inline double min_highlight_sec() {
  static double val = get_env_double("MIN_HIGHLIGHT_SEC", 30.0);
  return val;
}

inline double max_highlight_sec() {
  static double val = get_env_double("MAX_HIGHLIGHT_SEC", 90.0);
  return val;
}

inline int max_highlights() {
  static int val = get_env_int("MAX_HIGHLIGHTS", 5);
  return val;
}

/// Seconds of context padded around every candidate
inline double context_window_sec() {
  static double val = get_env_double("CONTEXT_WINDOW_SEC", 5.0);
  return val;
}

/**
 * @brief Reproduce the legacy right-edge pad, which never extends a group.
 * @note 0 (default) pads both edges symmetrically.
 */
inline bool legacy_right_pad() {
  static bool val = (get_env_int("LEGACY_RIGHT_PAD", 0) != 0);
  return val;
}

/// Frame-rate proxy used to weight speech density while growing windows
inline double density_fps() {
  static double val = get_env_double("DENSITY_FPS", 30.0);
  return val;
}

/// Candidate scoring worker threads (0 = auto)
inline int score_threads() {
  static int val = get_env_int("SCORE_THREADS", 0);
  return val;
}

// **---- REMOTE SCORER ----**

/// API key for the remote scorer; empty disables it
inline std::string scorer_api_key() {
  static std::string val =
      get_env_string("SCORER_API_KEY", get_env_string("COHERE_API_KEY", ""));
  return val;
}

inline std::string scorer_endpoint() {
  static std::string val = get_env_string(
      "SCORER_ENDPOINT", "https://api.cohere.ai/v1/generate");
  return val;
}

inline std::string scorer_model() {
  static std::string val = get_env_string("SCORER_MODEL", "command");
  return val;
}

inline double scorer_timeout_sec() {
  static double val = get_env_double("SCORER_TIMEOUT_SEC", 10.0);
  return val;
}

// **---- COLLABORATORS ----**

inline std::string whisper_model() {
  static std::string val = get_env_string("WHISPER_MODEL", "base");
  return val;
}

/// Transcription language hint (empty = auto-detect)
inline std::string language() {
  static std::string val = get_env_string("LANGUAGE", "");
  return val;
}

inline std::string cookies_path() {
  static std::string val = get_env_string("COOKIES_PATH", "cookies.txt");
  return val;
}

/// Output aspect ratio as "W:H"
inline std::string aspect_ratio() {
  static std::string val = get_env_string("ASPECT_RATIO", "9:16");
  return val;
}

inline int target_width() {
  static int val = get_env_int("TARGET_WIDTH", 1080);
  return val;
}

inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

} // namespace Config

// **---- AGGREGATES ----**

/**
 * @struct KeywordTiers
 * @brief The four weighted keyword tiers used by the heuristic text scorer.
 * @note Matching is a case-insensitive substring test, so multi-word
 *       phrases such as "key point" are allowed.
 */
struct KeywordTiers {
  std::vector<std::string> high_impact;
  std::vector<std::string> content_indicator;
  std::vector<std::string> emotional_trigger;
  std::vector<std::string> call_to_action;

  /// Built-in tiers
  static KeywordTiers defaults();

  /// Built-in tiers, each overridable through KEYWORDS_* variables
  static KeywordTiers from_env();
};

/**
 * @struct EngineConfig
 * @brief Parameters of the scene and highlight engine.
 */
struct EngineConfig {
  double min_scene_len = 0.5;
  double scene_threshold = 27.0;
  double merge_min_duration = 1.0;
  double min_duration = 30.0;
  double max_duration = 90.0;
  int max_highlights = 5;
  double context_window = 5.0;
  bool legacy_right_pad = false;
  double density_fps = 30.0;
  int score_threads = 0;
  KeywordTiers keywords = KeywordTiers::defaults();

  static EngineConfig from_env();

  /**
   * @brief Check parameter consistency.
   * @throws InvalidInputError on negative durations, min > max,
   *         non-positive density_fps or a threshold outside [0,255]
   */
  void validate() const;
};

/**
 * @struct ScorerConfig
 * @brief Parameters of the optional remote text scorer.
 */
struct ScorerConfig {
  std::string api_key;
  std::string endpoint = "https://api.cohere.ai/v1/generate";
  std::string model = "command";
  double timeout_sec = 10.0;

  bool enabled() const { return !api_key.empty(); }

  static ScorerConfig from_env();
};

} // namespace shortsmith

#endif // SHORTSMITH_CONFIG_HPP
