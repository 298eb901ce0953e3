#include "tirgum/block_renderer.h"
#include "tirgum/errors.h"
#include "raster.h"
#include <algorithm>

namespace tirgum {

BlockRenderer::BlockRenderer(const GlyphMetrics& metrics, const PanelStyle& style, int stroke_width)
    : metrics_(metrics), style_(style), stroke_width_(stroke_width)
{
    if (style_.canvas_width <= 0 || style_.canvas_height <= 0) {
        throw ConfigError("Canvas size must be positive");
    }
    if (style_.horizontal_padding < 0 || style_.vertical_padding < 0 || style_.bottom_margin < 0) {
        throw ConfigError("Panel padding and margin must not be negative");
    }
}

SubtitleBlock BlockRenderer::build(std::vector<Line> lines, const Segment& segment) const {
    SubtitleBlock block;
    block.segment = segment;
    block.lines = std::move(lines);

    int widest = 0;
    int text_height = 0;
    for (const auto& line : block.lines) {
        widest = std::max(widest, line.width);
        text_height += line.height;
    }

    const int line_count = static_cast<int>(block.lines.size());
    block.panel_width = std::min(widest + 2 * style_.horizontal_padding, style_.canvas_width);
    block.panel_height = text_height + style_.vertical_padding * (line_count + 1);

    int y = style_.vertical_padding;
    block.placements.reserve(block.lines.size());
    for (const auto& line : block.lines) {
        block.placements.emplace_back(
            right_aligned_offset(block.panel_width, style_.horizontal_padding, line.width), y);
        y += line.height + style_.vertical_padding;
    }

    block.panel_x = (style_.canvas_width - block.panel_width) / 2;
    block.panel_y = style_.canvas_height - style_.bottom_margin - block.panel_height;

    return block;
}

RasterOverlay BlockRenderer::rasterize(const SubtitleBlock& block) const {
    RasterOverlay overlay;
    overlay.x = block.panel_x;
    overlay.y = block.panel_y;
    overlay.width = block.panel_width;
    overlay.height = block.panel_height;
    overlay.start = block.segment.start;
    overlay.duration = block.segment.end - block.segment.start;

    const size_t pixel_count = static_cast<size_t>(std::max(overlay.width, 0)) *
                               static_cast<size_t>(std::max(overlay.height, 0));
    overlay.pixels.resize(pixel_count * 4);
    for (size_t i = 0; i < pixel_count; ++i) {
        overlay.pixels[i * 4 + 0] = style_.panel_color.r;
        overlay.pixels[i * 4 + 1] = style_.panel_color.g;
        overlay.pixels[i * 4 + 2] = style_.panel_color.b;
        overlay.pixels[i * 4 + 3] = style_.panel_color.a;
    }

    for (size_t i = 0; i < block.lines.size() && i < block.placements.size(); ++i) {
        const GlyphBitmap glyphs = metrics_.rasterize(block.lines[i].text, style_.text_color,
                                                      style_.outline_color, stroke_width_);
        const LinePlacement& at = block.placements[i];

        for (int row = 0; row < glyphs.height; ++row) {
            const int y = at.y + row;
            if (y < 0 || y >= overlay.height) continue;

            for (int col = 0; col < glyphs.width; ++col) {
                const int x = at.x + col;
                if (x < 0 || x >= overlay.width) continue;

                const uint8_t* src = &glyphs.pixels[(static_cast<size_t>(row) * glyphs.width + col) * 4];
                if (src[3] == 0) continue;

                uint8_t* dst = &overlay.pixels[(static_cast<size_t>(y) * overlay.width + x) * 4];
                raster::blend_pixel(dst, Color{src[0], src[1], src[2], 255}, src[3]);
            }
        }
    }

    return overlay;
}

} // namespace tirgum
