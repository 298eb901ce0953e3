#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief How translated text was mapped onto the original segments
 */
enum class ReconcileMode {
    Exact,              // Segmented translation, one entry per segment
    SentenceChunks,     // Full text split on sentence punctuation (approximate)
    WholeText           // No segment timing: one segment spanning the media
};

TIRGUM_API const char* to_string(ReconcileMode mode);

/**
 * @brief Reconciled segments plus a record of any degraded-mode handling
 */
struct ReconcileResult {
    std::vector<Segment> segments;
    ReconcileMode mode = ReconcileMode::Exact;
    size_t repeated_segments = 0;   // Segments that reused the last chunk
    size_t merged_chunks = 0;       // Surplus chunks appended to the last segment
};

/**
 * @brief Text Reconciler
 *
 * Maps translated text back onto the time-coded segments produced by
 * transcription. Timings are copied unchanged and the order of segments is
 * never altered; only the text is replaced.
 *
 * Policy by input shape:
 * - SegmentedText with one entry per segment: direct element-wise mapping.
 *   This is the only mode with guaranteed alignment.
 * - SegmentedText with a different count: CountMismatchError. The caller
 *   decides whether to fall back to the whole-text heuristic.
 * - FullText: split into sentence chunks and assign them in order. When
 *   chunks run out the last chunk is repeated; surplus chunks are appended
 *   to the last segment. Both are logged.
 * - No segments at all: one segment spanning [0, media_duration].
 *
 * The chunk assignment pass is order dependent and must run on one thread.
 */
class TIRGUM_API Reconciler {
public:
    explicit Reconciler(const ReconcileOptions& options = {});

    /**
     * @brief Reconcile a translation with the original segments
     *
     * @throws CountMismatchError if a segmented translation has the wrong length
     * @throws EmptyTranscriptError if the translation holds no text
     * @throws ReconciliationError if no segments exist and no media duration is known
     */
    ReconcileResult reconcile(const std::vector<Segment>& original,
                              const TranslationUnit& translation) const;

    /**
     * @brief Collapse the whole translation into one segment [0, duration]
     *
     * @throws EmptyTranscriptError if text is blank
     * @throws ReconciliationError if duration is not positive
     */
    static Segment whole_text_segment(const std::string& text, double duration);

    /**
     * @brief Split text into sentence-like chunks
     *
     * Delimiters are '.', '!' and '?'. A run of delimiters stays with the
     * preceding chunk; trailing text without a delimiter becomes the final
     * chunk. Chunks are whitespace-trimmed and empty chunks are dropped.
     */
    static std::vector<std::string> split_sentences(const std::string& text);

    const ReconcileOptions& options() const { return options_; }

private:
    ReconcileResult map_chunks(const std::vector<Segment>& original,
                               const std::string& text) const;

    ReconcileOptions options_;
};

/**
 * @brief Check the segment timing invariants (start >= 0, end > start)
 *
 * @throws InvalidSegmentError naming the first offending segment
 */
TIRGUM_API void validate_segments(const std::vector<Segment>& segments);

} // namespace tirgum
