#pragma once

#include "export.h"
#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Measured bounding box of a rendered string (pixels)
 */
struct TextExtent {
    int width;
    int height;

    TextExtent() : width(0), height(0) {}
    TextExtent(int width_, int height_) : width(width_), height(height_) {}
};

/**
 * @brief RGBA bitmap of a rendered string
 */
struct GlyphBitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;    // RGBA, row-major
};

/**
 * @brief Glyph metrics / font provider
 *
 * Measures and rasterizes strings that are already in visual order.
 * Implementations must be safe to call concurrently for read-only
 * measurement; the layout engine and block renderer never modify font state.
 *
 * Both calls throw FontResolutionError when the font has no glyph for a
 * character of the string.
 */
class TIRGUM_API GlyphMetrics {
public:
    virtual ~GlyphMetrics() = default;

    /**
     * @brief Bounding box of the string, inflated by the outline stroke
     */
    virtual TextExtent measure(const std::string& visual_text, int stroke_width) const = 0;

    /**
     * @brief Render the string with a filled glyph over a contrasting outline
     *
     * The bitmap has exactly the size returned by measure() for the same
     * string and stroke width.
     */
    virtual GlyphBitmap rasterize(const std::string& visual_text,
                                  const Color& fill,
                                  const Color& outline,
                                  int stroke_width) const = 0;
};

} // namespace tirgum
