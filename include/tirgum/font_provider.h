#pragma once

#include "export.h"
#include "glyph_metrics.h"
#include "types.h"
#include <memory>
#include <string>

namespace tirgum {

/**
 * @brief FreeType-backed glyph metrics provider
 *
 * Owns one FreeType library instance and one face. Glyph outlines are
 * inflated with FT_Stroker to produce the subtitle outline, so measured
 * widths include the stroke on both sides.
 *
 * Thread Safety:
 * - measure() and rasterize() serialise access to the face internally and
 *   may be called from several threads on the same instance
 *
 * Usage:
 * @code
 *   auto font = tirgum::FontResolver::resolve(config.font);
 *   tirgum::TextExtent box = font->measure("םולש", 2);
 * @endcode
 */
class TIRGUM_API FreeTypeFontProvider : public GlyphMetrics {
public:
    /**
     * @brief Open a font face
     *
     * @param font_path Path to a TrueType/OpenType file
     * @param pixel_size Glyph size in pixels
     * @throws FontResolutionError if FreeType cannot open the face
     */
    FreeTypeFontProvider(const std::string& font_path, int pixel_size);

    ~FreeTypeFontProvider() override;

    // Non-copyable, movable
    FreeTypeFontProvider(const FreeTypeFontProvider&) = delete;
    FreeTypeFontProvider& operator=(const FreeTypeFontProvider&) = delete;
    FreeTypeFontProvider(FreeTypeFontProvider&&) noexcept;
    FreeTypeFontProvider& operator=(FreeTypeFontProvider&&) noexcept;

    TextExtent measure(const std::string& visual_text, int stroke_width) const override;

    GlyphBitmap rasterize(const std::string& visual_text,
                          const Color& fill,
                          const Color& outline,
                          int stroke_width) const override;

    /**
     * @brief True if every non-whitespace character of text has a glyph
     */
    bool covers(const std::string& text) const;

    const std::string& font_path() const;
    int pixel_size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Resolves the first usable font from an ordered candidate list
 *
 * Candidates are tried in order (bundled resource first, then OS paths).
 * A candidate is usable when it exists, FreeType can open it, and it covers
 * FontOptions::script_sample. Resolution happens once at startup; the
 * resulting provider is passed to the engine.
 */
class TIRGUM_API FontResolver {
public:
    /**
     * @throws FontResolutionError if no candidate is usable
     */
    static std::unique_ptr<FreeTypeFontProvider> resolve(const FontOptions& options);
};

} // namespace tirgum
