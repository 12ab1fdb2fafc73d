/**
 * @file scene_merger.hpp
 * @brief Fusion of undersized scenes with their neighbours
 */

#ifndef SHORTSMITH_SCENE_MERGER_HPP
#define SHORTSMITH_SCENE_MERGER_HPP

#include <vector>

#include "types.hpp"

namespace shortsmith {

/**
 * @brief Check that a scene sequence is ordered and non-overlapping.
 * @throws InvalidInputError on a scene with end <= start, or a scene that
 *         starts before its predecessor ends
 * @note Gaps between scenes are allowed.
 */
void validate_scenes(const std::vector<Scene> &scenes);

/**
 * @brief Merge scenes shorter than min_duration into their neighbours.
 *
 * @details Single left-to-right pass with an accumulator. An undersized
 *          accumulator swallows the next scene; a large enough one is
 *          flushed. An undersized tail is fused backward into the last
 *          emitted scene. A lone scene is always kept, whatever its length.
 *
 * @param scenes Ordered, non-overlapping scenes
 * @param min_duration Minimum scene duration in seconds
 * @return New scene sequence covering the same range
 * @throws InvalidInputError if scenes fails validate_scenes()
 */
std::vector<Scene> merge_short_scenes(const std::vector<Scene> &scenes,
                                      double min_duration);

} // namespace shortsmith

#endif // SHORTSMITH_SCENE_MERGER_HPP
