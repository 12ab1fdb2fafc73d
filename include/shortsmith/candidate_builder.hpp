/**
 * @file candidate_builder.hpp
 * @brief Generation of overlapping highlight candidate windows
 *
 * @details For every start scene the builder grows a window one scene at a
 *          time and emits it whenever its duration lands inside an adaptive
 *          [min, max] band, or reaches the minimum at a natural speech
 *          break. Speech-dense, scene-rich windows get a longer band.
 *
 *          An emitted window is widened by one scene on each side, then
 *          padded by context_window seconds and labelled with the words it
 *          fully contains.
 *
 * @note The output deliberately contains overlapping candidates; scoring and
 *       selection resolve the overlap.
 */

#ifndef SHORTSMITH_CANDIDATE_BUILDER_HPP
#define SHORTSMITH_CANDIDATE_BUILDER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace shortsmith {

/**
 * @brief Upper end of the adaptive duration band.
 * @param speech_density Speech share of the window in [0,1]
 * @param content_richness min(1, scenes_in_window / 10)
 */
double adaptive_max_duration(double min_duration, double max_duration,
                             double speech_density, double content_richness);

/**
 * @brief Space-joined text of the words lying fully inside [start, end].
 * @param sorted_words Words ordered by start time
 */
std::string text_in_range(const std::vector<Word> &sorted_words, double start,
                          double end);

/**
 * @brief Build every candidate window over the scene sequence.
 *
 * @param scenes Ordered, non-overlapping scenes (normally merged)
 * @param words Transcript words in any order
 * @param config min/max duration, context window, density fps, right-pad
 *        mode
 * @return Candidates in generation order (start index, then window end)
 * @throws InvalidInputError on an invalid scene sequence or config
 */
std::vector<CandidateGroup> build_candidates(const std::vector<Scene> &scenes,
                                             const std::vector<Word> &words,
                                             const EngineConfig &config);

} // namespace shortsmith

#endif // SHORTSMITH_CANDIDATE_BUILDER_HPP
