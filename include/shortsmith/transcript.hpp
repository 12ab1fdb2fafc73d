/**
 * @file transcript.hpp
 * @brief Timestamped transcript model and Whisper JSON loading
 *
 * @details The transcription itself is produced by an external recognizer.
 *          This module reads its JSON output into segments and words and
 *          derives the coarse speech spans fed to the SceneSegmenter.
 */

#ifndef SHORTSMITH_TRANSCRIPT_HPP
#define SHORTSMITH_TRANSCRIPT_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace shortsmith {

struct TranscriptSegment {
  double start = 0.0;
  double end = 0.0;
  std::string text;
  std::vector<Word> words;
};

struct Transcript {
  std::vector<TranscriptSegment> segments;
  std::vector<Word> words; //< All words of all segments, in order
  std::string language;

  bool empty() const { return segments.empty(); }

  /**
   * @brief Words of the segments overlapping [start, end] whose start lies
   *        inside the range.
   * @note A segment without word timestamps contributes itself as one word.
   */
  std::vector<Word> words_in_range(double start, double end) const;
};

/**
 * @brief Parse Whisper JSON output.
 *
 * @details Reads segments[].{start,end,text,words[]} where each word has
 *          "word" (or "text"), "start", "end" and optionally "probability".
 *          Segments with blank text and zero-length words are dropped; text
 *          is trimmed.
 *
 * @throws Error if the document is not valid JSON or lacks "segments"
 */
Transcript parse_whisper_json(const std::string &json_text);

/**
 * @brief Load a Whisper JSON file.
 * @return true on success; on failure logs the reason and leaves out empty
 */
bool load_transcript(const std::string &path, Transcript &out);

/**
 * @brief Group transcript segments into coarse speech spans.
 *
 * @details Consecutive segments accumulate into one span. A span is cut
 *          before a segment that would push its speech time over max_span,
 *          and closed at a pause longer than max_gap (or at the last
 *          segment) once it holds at least min_span seconds of speech.
 */
std::vector<TimeSegment> speech_spans(const Transcript &transcript,
                                      double min_span = 1.0,
                                      double max_span = 60.0,
                                      double max_gap = 1.0);

} // namespace shortsmith

#endif // SHORTSMITH_TRANSCRIPT_HPP
