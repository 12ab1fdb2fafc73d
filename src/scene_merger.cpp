/**
 * @file scene_merger.cpp
 * @brief Scene validation and short-scene merging
 */

#include "shortsmith/scene_merger.hpp"

#include <fmt/core.h>

#include "shortsmith/errors.hpp"
#include "shortsmith/logging.hpp"

namespace shortsmith {

namespace {

/// Tolerance for float noise at shared scene edges
constexpr double EDGE_EPSILON = 1e-9;

} // anonymous namespace

void validate_scenes(const std::vector<Scene> &scenes) {
  for (size_t i = 0; i < scenes.size(); ++i) {
    const Scene &s = scenes[i];
    if (s.end_time() <= s.start_time()) {
      throw InvalidInputError(
          fmt::format("scene {} has non-positive duration ({:.3f}s -> {:.3f}s)", i,
                      s.start_time(), s.end_time()));
    }
    if (i == 0)
      continue;
    const Scene &prev = scenes[i - 1];
    if (s.start_time() < prev.start_time()) {
      throw InvalidInputError(
          fmt::format("scene {} starts at {:.3f}s, before scene {} ({:.3f}s)",
                      i, s.start_time(), i - 1, prev.start_time()));
    }
    if (s.start_time() + EDGE_EPSILON < prev.end_time()) {
      throw InvalidInputError(
          fmt::format("scene {} ({:.3f}s) overlaps scene {} ending {:.3f}s", i,
                      s.start_time(), i - 1, prev.end_time()));
    }
  }
}

std::vector<Scene> merge_short_scenes(const std::vector<Scene> &scenes,
                                      double min_duration) {
  validate_scenes(scenes);

  std::vector<Scene> merged;
  if (scenes.empty())
    return merged;

  Scene current = scenes.front();
  for (size_t i = 1; i < scenes.size(); ++i) {
    if (current.duration() < min_duration) {
      current = Scene::fuse(current, scenes[i]);
    } else {
      merged.push_back(current);
      current = scenes[i];
    }
  }

  // **---- TAIL ----**

  if (current.duration() >= min_duration || merged.empty()) {
    merged.push_back(current);
  } else {
    Scene prev = merged.back();
    merged.pop_back();
    merged.push_back(Scene::fuse(prev, current));
  }

  LOG_DEBUG("Merged {} scenes into {} (min {:.2f}s)", scenes.size(),
            merged.size(), min_duration);
  return merged;
}

} // namespace shortsmith
