#include "tirgum/font_provider.h"
#include "tirgum/errors.h"
#include "raster.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_GLYPH_H
#include FT_STROKER_H

namespace tirgum {

namespace {

std::string codepoint_name(UChar32 c) {
    char buf[16];
    snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned int>(c));
    return buf;
}

int from_26_6(FT_Pos value) {
    return static_cast<int>(std::lround(value / 64.0));
}

// Releases an FT_Glyph on scope exit (the pointer may be replaced in place)
struct GlyphHandle {
    FT_Glyph glyph = nullptr;
    ~GlyphHandle() {
        if (glyph) FT_Done_Glyph(glyph);
    }
};

struct PlacedGlyph {
    FT_UInt index;
    int pen_x;
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════════════════════

class FreeTypeFontProvider::Impl {
public:
    FT_Library library = nullptr;
    FT_Face face = nullptr;
    FT_Stroker stroker = nullptr;
    std::string path;
    int pixel_size;
    std::mutex mutex;

    Impl(const std::string& font_path, int size)
        : path(font_path), pixel_size(size)
    {
        if (size <= 0) {
            throw FontResolutionError("Invalid font pixel size: " + std::to_string(size));
        }
        if (FT_Init_FreeType(&library) != 0) {
            library = nullptr;
            throw FontResolutionError("Failed to initialize FreeType");
        }
        if (FT_New_Face(library, font_path.c_str(), 0, &face) != 0) {
            face = nullptr;
            release();
            throw FontResolutionError("Failed to open font: " + font_path);
        }
        if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(size)) != 0) {
            release();
            throw FontResolutionError("Font does not support pixel size " +
                                      std::to_string(size) + ": " + font_path);
        }
        if (FT_Stroker_New(library, &stroker) != 0) {
            stroker = nullptr;
            release();
            throw FontResolutionError("Failed to create FreeType stroker");
        }
    }

    ~Impl() {
        release();
    }

    void release() {
        if (stroker) {
            FT_Stroker_Done(stroker);
            stroker = nullptr;
        }
        if (face) {
            FT_Done_Face(face);
            face = nullptr;
        }
        if (library) {
            FT_Done_FreeType(library);
            library = nullptr;
        }
    }

    int ascender() const { return from_26_6(face->size->metrics.ascender); }
    int descender() const { return -from_26_6(face->size->metrics.descender); }
    int line_height(int stroke_width) const { return ascender() + descender() + 2 * stroke_width; }

    int blank_advance() {
        FT_UInt space = FT_Get_Char_Index(face, ' ');
        if (space != 0 && FT_Load_Glyph(face, space, FT_LOAD_DEFAULT) == 0) {
            return from_26_6(face->glyph->advance.x);
        }
        return pixel_size / 4;
    }

    // Pen position of every drawable glyph; returns the total advance
    int place(const std::string& text, std::vector<PlacedGlyph>& glyphs) {
        const bool kerning = FT_HAS_KERNING(face);
        FT_UInt previous = 0;
        int pen = 0;

        for (UChar32 c : raster::decode_utf8(text)) {
            if (raster::is_ignorable(c)) {
                continue;
            }

            FT_UInt index = FT_Get_Char_Index(face, static_cast<FT_ULong>(c));
            if (index == 0) {
                if (raster::is_blank(c)) {
                    pen += blank_advance();
                    previous = 0;
                    continue;
                }
                throw FontResolutionError("Font " + path + " has no glyph for " + codepoint_name(c));
            }

            if (kerning && previous != 0) {
                FT_Vector delta;
                if (FT_Get_Kerning(face, previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                    pen += from_26_6(delta.x);
                }
            }

            if (FT_Load_Glyph(face, index, FT_LOAD_DEFAULT) != 0) {
                throw FontResolutionError("Failed to load glyph " + codepoint_name(c) + " from " + path);
            }

            glyphs.push_back({index, pen});
            pen += from_26_6(face->glyph->advance.x);
            previous = index;
        }

        return std::max(pen, 0);
    }

    void draw_glyph(GlyphBitmap& target, const PlacedGlyph& placed, int stroke_width,
                    int baseline, bool outline, const Color& color) {
        if (FT_Load_Glyph(face, placed.index, FT_LOAD_NO_BITMAP) != 0) {
            throw FontResolutionError("Failed to load glyph outline from " + path);
        }

        GlyphHandle handle;
        if (FT_Get_Glyph(face->glyph, &handle.glyph) != 0) {
            handle.glyph = nullptr;
            throw FontResolutionError("Failed to copy glyph from " + path);
        }
        if (outline && FT_Glyph_StrokeBorder(&handle.glyph, stroker, 0, 1) != 0) {
            throw FontResolutionError("Failed to stroke glyph from " + path);
        }
        if (FT_Glyph_To_Bitmap(&handle.glyph, FT_RENDER_MODE_NORMAL, nullptr, 1) != 0) {
            throw FontResolutionError("Failed to render glyph from " + path);
        }

        auto bitmap_glyph = reinterpret_cast<FT_BitmapGlyph>(handle.glyph);
        const FT_Bitmap& bitmap = bitmap_glyph->bitmap;
        const int origin_x = stroke_width + placed.pen_x + bitmap_glyph->left;
        const int origin_y = baseline - bitmap_glyph->top;

        for (int row = 0; row < static_cast<int>(bitmap.rows); ++row) {
            const int y = origin_y + row;
            if (y < 0 || y >= target.height) continue;

            for (int col = 0; col < static_cast<int>(bitmap.width); ++col) {
                const int x = origin_x + col;
                if (x < 0 || x >= target.width) continue;

                const uint8_t coverage = bitmap.buffer[row * bitmap.pitch + col];
                if (coverage == 0) continue;

                uint8_t* dst = &target.pixels[(static_cast<size_t>(y) * target.width + x) * 4];
                raster::blend_pixel(dst, color, coverage);
            }
        }
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

FreeTypeFontProvider::FreeTypeFontProvider(const std::string& font_path, int pixel_size)
    : pimpl_(std::make_unique<Impl>(font_path, pixel_size))
{}

FreeTypeFontProvider::~FreeTypeFontProvider() = default;

FreeTypeFontProvider::FreeTypeFontProvider(FreeTypeFontProvider&&) noexcept = default;
FreeTypeFontProvider& FreeTypeFontProvider::operator=(FreeTypeFontProvider&&) noexcept = default;

TextExtent FreeTypeFontProvider::measure(const std::string& visual_text, int stroke_width) const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);

    std::vector<PlacedGlyph> glyphs;
    const int advance = pimpl_->place(visual_text, glyphs);
    const int width = advance > 0 ? advance + 2 * stroke_width : 0;
    return TextExtent(width, pimpl_->line_height(stroke_width));
}

GlyphBitmap FreeTypeFontProvider::rasterize(const std::string& visual_text,
                                            const Color& fill,
                                            const Color& outline,
                                            int stroke_width) const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);

    std::vector<PlacedGlyph> glyphs;
    const int advance = pimpl_->place(visual_text, glyphs);

    GlyphBitmap bitmap;
    bitmap.width = advance > 0 ? advance + 2 * stroke_width : 0;
    bitmap.height = pimpl_->line_height(stroke_width);
    bitmap.pixels.assign(static_cast<size_t>(bitmap.width) * bitmap.height * 4, 0);
    if (bitmap.width == 0) {
        return bitmap;
    }

    const int baseline = stroke_width + pimpl_->ascender();

    // Outline pass first so neighbouring outlines never cover a fill
    if (stroke_width > 0 && outline.a > 0) {
        FT_Stroker_Set(pimpl_->stroker, static_cast<FT_Fixed>(stroke_width) * 64,
                       FT_STROKER_LINECAP_ROUND, FT_STROKER_LINEJOIN_ROUND, 0);
        for (const auto& placed : glyphs) {
            pimpl_->draw_glyph(bitmap, placed, stroke_width, baseline, true, outline);
        }
    }

    for (const auto& placed : glyphs) {
        pimpl_->draw_glyph(bitmap, placed, stroke_width, baseline, false, fill);
    }

    return bitmap;
}

bool FreeTypeFontProvider::covers(const std::string& text) const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);

    for (UChar32 c : raster::decode_utf8(text)) {
        if (raster::is_blank(c) || raster::is_ignorable(c)) {
            continue;
        }
        if (FT_Get_Char_Index(pimpl_->face, static_cast<FT_ULong>(c)) == 0) {
            return false;
        }
    }
    return true;
}

const std::string& FreeTypeFontProvider::font_path() const {
    return pimpl_->path;
}

int FreeTypeFontProvider::pixel_size() const {
    return pimpl_->pixel_size;
}

// ═══════════════════════════════════════════════════════════════════════════
// Font resolution
// ═══════════════════════════════════════════════════════════════════════════

std::unique_ptr<FreeTypeFontProvider> FontResolver::resolve(const FontOptions& options) {
    for (const auto& candidate : options.candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            continue;
        }

        std::unique_ptr<FreeTypeFontProvider> provider;
        try {
            provider = std::make_unique<FreeTypeFontProvider>(candidate, options.pixel_size);
        } catch (const FontResolutionError& e) {
            std::cerr << "[Tirgum] Skipping font candidate: " << e.what() << "\n";
            continue;
        }

        if (!provider->covers(options.script_sample)) {
            std::cerr << "[Tirgum] Font " << candidate << " does not cover the target script\n";
            continue;
        }

        std::cout << "[Tirgum] Using font: " << candidate
                  << " (" << options.pixel_size << "px)\n";
        return provider;
    }

    std::string tried;
    for (const auto& candidate : options.candidates) {
        if (!tried.empty()) tried += ", ";
        tried += candidate;
    }
    throw FontResolutionError("No font resource covers the target script (tried: " + tried + ")");
}

} // namespace tirgum
