#pragma once

#include "export.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace tirgum {

/**
 * @brief Base class of every error thrown by the library
 */
class TIRGUM_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Translated text could not be mapped onto the original segments
 */
class TIRGUM_API ReconciliationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Segmented translation length differs from the segment count
 *
 * Recoverable: the caller decides whether to fall back to the whole-text
 * heuristic or abort.
 */
class TIRGUM_API CountMismatchError : public ReconciliationError {
public:
    CountMismatchError(size_t expected, size_t got)
        : ReconciliationError("Translated segment count mismatch: expected " +
                              std::to_string(expected) + ", got " + std::to_string(got)),
          expected_(expected), got_(got) {}

    size_t expected() const { return expected_; }
    size_t got() const { return got_; }

private:
    size_t expected_;
    size_t got_;
};

/**
 * @brief No usable glyph resource for the required script
 */
class TIRGUM_API FontResolutionError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Transcription or translation yielded no usable text
 */
class TIRGUM_API EmptyTranscriptError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Segment timing violates start >= 0 and end > start
 */
class TIRGUM_API InvalidSegmentError : public Error {
public:
    using Error::Error;
};

/**
 * @brief External collaborator failed (service unavailable, malformed response, ...)
 */
class TIRGUM_API ServiceError : public Error {
public:
    ServiceError(const std::string& service, const std::string& message, int exit_code = -1)
        : Error(service + ": " + message), service_(service), exit_code_(exit_code) {}

    const std::string& service() const { return service_; }
    int exit_code() const { return exit_code_; }

private:
    std::string service_;
    int exit_code_;
};

/**
 * @brief Malformed configuration value
 */
class TIRGUM_API ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Media exceeds the configured maximum duration
 */
class TIRGUM_API DurationLimitError : public Error {
public:
    DurationLimitError(double duration, double limit)
        : Error("Media duration " + std::to_string(duration) +
                "s exceeds the limit of " + std::to_string(limit) + "s"),
          duration_(duration), limit_(limit) {}

    double duration() const { return duration_; }
    double limit() const { return limit_; }

private:
    double duration_;
    double limit_;
};

/**
 * @brief A single word is wider than the maximum line width
 *
 * Not an error: the word is emitted on its own oversized line.
 */
struct LayoutOverflowWarning {
    std::string word;
    int width;
    int max_width;
};

} // namespace tirgum
