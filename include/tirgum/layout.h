#pragma once

#include "bidi.h"
#include "errors.h"
#include "export.h"
#include "glyph_metrics.h"
#include "types.h"
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Lines produced by one wrapping pass, with any overflow warnings
 */
struct LayoutResult {
    std::vector<Line> lines;
    std::vector<LayoutOverflowWarning> warnings;
};

/**
 * @brief Bidirectional Layout Engine
 *
 * Greedy word wrap over logical-order text. The base direction is decided
 * once for the whole text; after each word is added the candidate line is
 * reordered to visual order at that direction and measured (outline stroke
 * included). The word that overflows the maximum width starts the next
 * line. Words are never split: a single word wider than the maximum is
 * emitted on its own line and reported as a LayoutOverflowWarning.
 *
 * Wrapping is idempotent: wrapping the space-joined logical text of a
 * result again at the same width reproduces the same lines.
 */
class TIRGUM_API LayoutEngine {
public:
    /**
     * @param metrics Glyph metrics provider (must outlive the engine)
     * @param options Wrapping options; max_line_width must be positive
     * @throws ConfigError if max_line_width <= 0
     */
    LayoutEngine(const GlyphMetrics& metrics, const LayoutOptions& options);

    /**
     * @brief Wrap logical-order text into visual-order lines
     *
     * Blank text produces no lines.
     *
     * @throws FontResolutionError if the font cannot render the text
     */
    LayoutResult wrap(const std::string& logical_text) const;

    /**
     * @brief Measure one logical-order line as it would be drawn
     *
     * @param direction Base direction of the paragraph the line belongs to
     */
    Line make_line(const std::string& logical_text,
                   TextDirection direction = TextDirection::Auto) const;

    /**
     * @brief Whitespace-delimited words in logical order
     */
    static std::vector<std::string> tokenize(const std::string& text);

    int max_line_width() const { return options_.max_line_width; }

private:
    const GlyphMetrics& metrics_;
    LayoutOptions options_;
};

} // namespace tirgum
