/**
 * @file errors.hpp
 * @brief Exception hierarchy for Shortsmith
 *
 * @details
 *          - InvalidInputError: malformed scene sequence or engine parameters.
 *            Fatal, surfaced to the caller.
 *
 *          - ExternalScorerFailure: the remote text scorer timed out, was
 *            unreachable or replied with garbage. Always recovered locally.
 *
 *          - MediaError: the frame-difference scanner could not decode the
 *            source video.
 *
 * @note Empty inputs are not errors anywhere in the engine.
 */

#ifndef SHORTSMITH_ERRORS_HPP
#define SHORTSMITH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace shortsmith {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

class InvalidInputError : public Error {
public:
  explicit InvalidInputError(const std::string &what) : Error(what) {}
};

class ExternalScorerFailure : public Error {
public:
  explicit ExternalScorerFailure(const std::string &what) : Error(what) {}
};

class MediaError : public Error {
public:
  explicit MediaError(const std::string &what) : Error(what) {}
};

} // namespace shortsmith

#endif // SHORTSMITH_ERRORS_HPP
