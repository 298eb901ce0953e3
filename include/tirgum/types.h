#pragma once

#include "export.h"
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tirgum {

/**
 * @brief Time-coded unit of transcript text
 *
 * Timing is owned by the transcription service. Once produced, only the
 * text field is ever replaced (by the Reconciler); start/end never change.
 */
struct Segment {
    int id;                         // Segment index (position in the transcript)
    double start;                   // Start time in seconds (>= 0)
    double end;                     // End time in seconds (> start)
    std::string text;               // Transcribed/translated text

    Segment() : id(0), start(0.0), end(0.0) {}
    Segment(double start_, double end_, std::string text_, int id_ = 0)
        : id(id_), start(start_), end(end_), text(std::move(text_)) {}
};

/**
 * @brief Translation returned as one undifferentiated block
 */
struct FullText {
    std::string text;
};

/**
 * @brief Translation returned as an array of strings
 *
 * The array length may or may not match the number of original segments.
 */
struct SegmentedText {
    std::vector<std::string> texts;
};

/**
 * @brief Translated content in either shape the translation service produces
 */
using TranslationUnit = std::variant<FullText, SegmentedText>;

/**
 * @brief One wrapped line of subtitle text
 */
struct Line {
    std::string text;               // Visual (draw) order
    std::string logical_text;       // Logical (reading) order
    int width;                      // Measured width in pixels (stroke included)
    int height;                     // Measured height in pixels (stroke included)
    bool overflow;                  // Single word wider than the maximum width

    Line() : width(0), height(0), overflow(false) {}
};

/**
 * @brief Position of a line inside its panel (top-left, pixels)
 */
struct LinePlacement {
    int x;
    int y;

    LinePlacement() : x(0), y(0) {}
    LinePlacement(int x_, int y_) : x(x_), y(y_) {}
};

/**
 * @brief Positioned subtitle panel for one segment
 *
 * Produced and owned by a single rendering pass; handed to the compositor
 * by value.
 */
struct SubtitleBlock {
    std::vector<Line> lines;
    std::vector<LinePlacement> placements;  // One per line, panel coordinates
    int panel_width;
    int panel_height;
    int panel_x;                    // Canvas position (bottom-center anchored)
    int panel_y;
    Segment segment;

    SubtitleBlock() : panel_width(0), panel_height(0), panel_x(0), panel_y(0) {}
};

/**
 * @brief RGBA colour
 */
struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    uint8_t a;
};

/**
 * @brief Rasterized subtitle block ready for compositing
 */
struct RasterOverlay {
    int x;                          // Canvas position of the top-left pixel
    int y;
    int width;
    int height;
    std::vector<uint8_t> pixels;    // RGBA, row-major, width * height * 4
    double start;                   // Seconds
    double duration;                // Seconds

    RasterOverlay() : x(0), y(0), width(0), height(0), start(0.0), duration(0.0) {}
};

/**
 * @brief Result returned by a transcription service
 */
struct TranscribeResult {
    std::vector<Segment> segments;   // Time-coded segments (may be empty)
    std::string text;                // Full transcript text
    std::string language;            // Detected/specified language
    double duration;                 // Total media duration in seconds

    TranscribeResult() : duration(0.0) {}

    // Iterator support for range-based for loops
    auto begin() const { return segments.begin(); }
    auto end() const { return segments.end(); }
    auto begin() { return segments.begin(); }
    auto end() { return segments.end(); }
};

// ═══════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════

/**
 * @brief Line wrapping configuration
 */
struct LayoutOptions {
    int max_line_width = 0;          // Pixels (0 = canvas width minus panel padding)
    int stroke_width = 2;            // Outline width used by the renderer (pixels)
    bool shape_arabic = true;        // Apply Arabic presentation-form shaping
};

/**
 * @brief Subtitle panel geometry and colours
 */
struct PanelStyle {
    int canvas_width = 1280;         // Video frame width
    int canvas_height = 720;         // Video frame height
    int horizontal_padding = 20;     // Left/right padding inside the panel
    int vertical_padding = 10;       // Padding above, below and between lines
    int bottom_margin = 40;          // Distance from the bottom edge of the frame

    Color panel_color{0, 0, 0, 160};         // Semi-opaque background
    Color text_color{255, 255, 255, 255};    // Glyph fill
    Color outline_color{0, 0, 0, 255};       // Glyph outline
};

/**
 * @brief Font resource configuration
 */
struct FontOptions {
    // Ordered candidates: bundled resource first, then OS fallbacks
    std::vector<std::string> candidates = {
        "fonts/NotoSansHebrew-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoSansHebrew-Regular.ttf",
        "/usr/share/fonts/noto/NotoSansHebrew-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    int pixel_size = 28;             // Glyph size in pixels
    std::string script_sample = "אבגדהוזחטיכלמנסעפצקרשת";  // Must be covered by the face
};

/**
 * @brief Reconciliation configuration
 */
struct ReconcileOptions {
    double media_duration = 0.0;     // Seconds, used when no segment timing exists
};

} // namespace tirgum
