#pragma once

#include "export.h"
#include "types.h"
#include <functional>
#include <string>

namespace tirgum {

/**
 * @brief Output artifact handed to the video compositor
 */
enum class OutputMode {
    SubtitleFile,       // SRT burned in by the compositor's subtitle filter
    RasterOverlay       // Pre-rendered RGBA panels composited per time window
};

/**
 * @brief ffmpeg re-encode settings
 */
struct CompositorOptions {
    std::string ffmpeg_binary = "ffmpeg";
    std::string video_codec = "libx264";
    std::string preset = "ultrafast";      // Fast encoding speed
    int crf = 23;                          // Default quality for H.264
    std::string pixel_format = "yuv420p";
    double duration_limit = 300.0;         // Passed as -t (seconds, 0 = none)

    // Forced style for the subtitle burn-in filter
    std::string font_name = "Noto Sans Hebrew";
    int font_size = 28;
    int outline = 2;
    int shadow = 1;
    int alignment = 2;                     // ASS numpad alignment (2 = bottom center)
    int margin_v = 40;
};

/**
 * @brief End-to-end job settings
 */
struct JobOptions {
    std::string source_language = "en";
    std::string target_language = "he";
    double max_duration = 300.0;           // Reject longer media (seconds)
    OutputMode output_mode = OutputMode::SubtitleFile;
    std::string work_dir;                  // Temporary files (empty = system temp dir)
    bool keep_temp_files = false;
    bool write_metadata = true;            // <video>_metadata.json beside the output
};

/**
 * @brief Complete engine configuration
 *
 * Defaults live in the option structs. from_environment() overlays:
 *
 *   TIRGUM_FONT_PATHS       ':'-separated font candidates (replaces the defaults)
 *   TIRGUM_FONT_SIZE        glyph size in pixels
 *   TIRGUM_SCRIPT_SAMPLE    characters the font must cover
 *   TIRGUM_STROKE_WIDTH     outline width in pixels
 *   TIRGUM_MAX_LINE_WIDTH   wrap width in pixels (0 = canvas minus padding)
 *   TIRGUM_CANVAS_WIDTH     video frame width
 *   TIRGUM_CANVAS_HEIGHT    video frame height
 *   TIRGUM_BOTTOM_MARGIN    panel distance from the bottom edge
 *   TIRGUM_MAX_DURATION     maximum media duration in seconds
 *   TIRGUM_SOURCE_LANG      transcript language code
 *   TIRGUM_TARGET_LANG      translation language code
 *   TIRGUM_OUTPUT_MODE      "subtitle" or "overlay"
 *   TIRGUM_FFMPEG           ffmpeg binary
 *   TIRGUM_WORK_DIR         directory for temporary files
 */
struct EngineConfig {
    LayoutOptions layout;
    PanelStyle panel;
    FontOptions font;
    CompositorOptions compositor;
    JobOptions job;

    using EnvLookup = std::function<const char*(const char*)>;

    TIRGUM_API static EngineConfig from_environment();

    /**
     * @throws ConfigError on a malformed value
     */
    TIRGUM_API static EngineConfig from_environment(const EnvLookup& lookup);

    /**
     * @brief Layout options with max_line_width resolved against the canvas
     */
    TIRGUM_API LayoutOptions resolved_layout() const;

    /**
     * @throws ConfigError if a value is out of range
     */
    TIRGUM_API void validate() const;
};

} // namespace tirgum
