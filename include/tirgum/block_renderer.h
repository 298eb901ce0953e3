#pragma once

#include "export.h"
#include "glyph_metrics.h"
#include "types.h"
#include <vector>

namespace tirgum {

/**
 * @brief Subtitle Block Renderer
 *
 * Turns wrapped lines into a positioned subtitle panel and, on request,
 * into an RGBA overlay.
 *
 * Geometry:
 * - panel width  = widest line + 2 * horizontal padding, clamped to the canvas
 * - panel height = sum of line heights + vertical padding around and between lines
 * - line x       = panel width - horizontal padding - line width (right-aligned
 *                  whatever the script direction)
 * - the panel is anchored bottom-center, bottom_margin pixels above the frame edge
 */
class TIRGUM_API BlockRenderer {
public:
    /**
     * @param metrics Glyph metrics provider used for rasterization (must outlive the renderer)
     * @param style Panel geometry and colours
     * @param stroke_width Glyph outline width; must match the one used for layout
     */
    BlockRenderer(const GlyphMetrics& metrics, const PanelStyle& style, int stroke_width);

    /**
     * @brief Compute panel size and line placements for one segment
     */
    SubtitleBlock build(std::vector<Line> lines, const Segment& segment) const;

    /**
     * @brief Draw the panel and its lines into an RGBA overlay
     *
     * Pixels outside the panel are clipped.
     *
     * @throws FontResolutionError if the font cannot render a line
     */
    RasterOverlay rasterize(const SubtitleBlock& block) const;

    /**
     * @brief Horizontal offset of a right-aligned line inside its panel
     */
    static int right_aligned_offset(int panel_width, int horizontal_padding, int line_width) {
        return panel_width - horizontal_padding - line_width;
    }

    const PanelStyle& style() const { return style_; }

private:
    const GlyphMetrics& metrics_;
    PanelStyle style_;
    int stroke_width_;
};

} // namespace tirgum
