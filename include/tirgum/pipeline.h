#pragma once

#include "block_renderer.h"
#include "config.h"
#include "errors.h"
#include "export.h"
#include "glyph_metrics.h"
#include "layout.h"
#include "reconciler.h"
#include "types.h"
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Everything one pipeline pass produced
 */
struct PipelineResult {
    ReconcileResult reconciled;                     // Translated segments, original timings
    std::vector<SubtitleBlock> blocks;              // One per non-blank segment, input order
    std::vector<LayoutOverflowWarning> warnings;
};

/**
 * @brief Reconcile → layout → block pipeline
 *
 * Wires the Reconciler, LayoutEngine and BlockRenderer together with one
 * configuration so that layout and rasterization share the same stroke
 * width and line width.
 *
 * Usage:
 * @code
 *   auto font = tirgum::FontResolver::resolve(config.font);
 *   tirgum::SubtitlePipeline pipeline(*font, config);
 *   auto result = pipeline.run(segments, tirgum::SegmentedText{texts}, duration);
 *   std::string srt = pipeline.to_srt(result.blocks);
 * @endcode
 */
class TIRGUM_API SubtitlePipeline {
public:
    /**
     * @param metrics Glyph metrics provider (must outlive the pipeline)
     * @throws ConfigError if the configuration is invalid
     */
    SubtitlePipeline(const GlyphMetrics& metrics, const EngineConfig& config);

    /**
     * @brief Reconcile a translation and lay out every segment
     *
     * @param media_duration Used only when there are no original segments
     * @throws InvalidSegmentError if an original segment has invalid timing
     * @throws CountMismatchError if a segmented translation has the wrong length
     * @throws EmptyTranscriptError if the translation holds no text
     * @throws FontResolutionError if the font cannot render the text
     */
    PipelineResult run(const std::vector<Segment>& original,
                       const TranslationUnit& translation,
                       double media_duration) const;

    /**
     * @brief Lay out already translated segments
     *
     * Segments whose text is blank produce no block.
     */
    std::vector<SubtitleBlock> layout(const std::vector<Segment>& translated,
                                      std::vector<LayoutOverflowWarning>* warnings = nullptr) const;

    /**
     * @brief Wrap one segment and build its panel
     */
    SubtitleBlock layout_segment(const Segment& segment,
                                 std::vector<LayoutOverflowWarning>* warnings = nullptr) const;

    std::vector<RasterOverlay> rasterize(const std::vector<SubtitleBlock>& blocks) const;

    std::string to_srt(const std::vector<SubtitleBlock>& blocks, bool use_wrapped_lines = false) const;
    std::string to_vtt(const std::vector<SubtitleBlock>& blocks, bool use_wrapped_lines = false) const;

    const EngineConfig& config() const { return config_; }
    const LayoutEngine& layout_engine() const { return layout_; }
    const BlockRenderer& renderer() const { return renderer_; }

private:
    EngineConfig config_;
    LayoutEngine layout_;
    BlockRenderer renderer_;
};

} // namespace tirgum
