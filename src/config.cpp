#include "tirgum/config.h"
#include "tirgum/errors.h"
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace tirgum {

namespace {

int parse_int(const char* name, const std::string& value) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(std::string(name) + " is not an integer: '" + value + "'");
        }
        return result;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not an integer: '" + value + "'");
    }
}

double parse_double(const char* name, const std::string& value) {
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(std::string(name) + " is not a number: '" + value + "'");
        }
        return result;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " is not a number: '" + value + "'");
    }
}

std::vector<std::string> split_paths(const std::string& value) {
    std::vector<std::string> paths;
    std::istringstream stream(value);
    std::string path;
    while (std::getline(stream, path, ':')) {
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

} // namespace

EngineConfig EngineConfig::from_environment() {
    return from_environment([](const char* name) { return std::getenv(name); });
}

EngineConfig EngineConfig::from_environment(const EnvLookup& lookup) {
    EngineConfig config;

    auto get = [&](const char* name, std::string& out) {
        const char* value = lookup(name);
        if (value == nullptr || *value == '\0') {
            return false;
        }
        out = value;
        return true;
    };

    std::string value;
    if (get("TIRGUM_FONT_PATHS", value)) {
        config.font.candidates = split_paths(value);
    }
    if (get("TIRGUM_FONT_SIZE", value)) {
        config.font.pixel_size = parse_int("TIRGUM_FONT_SIZE", value);
        config.compositor.font_size = config.font.pixel_size;
    }
    if (get("TIRGUM_SCRIPT_SAMPLE", value)) {
        config.font.script_sample = value;
    }
    if (get("TIRGUM_STROKE_WIDTH", value)) {
        config.layout.stroke_width = parse_int("TIRGUM_STROKE_WIDTH", value);
        config.compositor.outline = config.layout.stroke_width;
    }
    if (get("TIRGUM_MAX_LINE_WIDTH", value)) {
        config.layout.max_line_width = parse_int("TIRGUM_MAX_LINE_WIDTH", value);
    }
    if (get("TIRGUM_CANVAS_WIDTH", value)) {
        config.panel.canvas_width = parse_int("TIRGUM_CANVAS_WIDTH", value);
    }
    if (get("TIRGUM_CANVAS_HEIGHT", value)) {
        config.panel.canvas_height = parse_int("TIRGUM_CANVAS_HEIGHT", value);
    }
    if (get("TIRGUM_BOTTOM_MARGIN", value)) {
        config.panel.bottom_margin = parse_int("TIRGUM_BOTTOM_MARGIN", value);
        config.compositor.margin_v = config.panel.bottom_margin;
    }
    if (get("TIRGUM_MAX_DURATION", value)) {
        config.job.max_duration = parse_double("TIRGUM_MAX_DURATION", value);
        config.compositor.duration_limit = config.job.max_duration;
    }
    if (get("TIRGUM_SOURCE_LANG", value)) {
        config.job.source_language = value;
    }
    if (get("TIRGUM_TARGET_LANG", value)) {
        config.job.target_language = value;
    }
    if (get("TIRGUM_OUTPUT_MODE", value)) {
        if (value == "subtitle") {
            config.job.output_mode = OutputMode::SubtitleFile;
        } else if (value == "overlay") {
            config.job.output_mode = OutputMode::RasterOverlay;
        } else {
            throw ConfigError("TIRGUM_OUTPUT_MODE must be 'subtitle' or 'overlay', got '" + value + "'");
        }
    }
    if (get("TIRGUM_FFMPEG", value)) {
        config.compositor.ffmpeg_binary = value;
    }
    if (get("TIRGUM_WORK_DIR", value)) {
        config.job.work_dir = value;
    }

    config.validate();
    return config;
}

LayoutOptions EngineConfig::resolved_layout() const {
    LayoutOptions resolved = layout;
    if (resolved.max_line_width <= 0) {
        resolved.max_line_width = panel.canvas_width - 2 * panel.horizontal_padding;
    }
    return resolved;
}

void EngineConfig::validate() const {
    if (font.candidates.empty()) {
        throw ConfigError("At least one font candidate is required");
    }
    if (font.pixel_size <= 0) {
        throw ConfigError("Font size must be positive");
    }
    if (layout.stroke_width < 0) {
        throw ConfigError("Stroke width must not be negative");
    }
    if (panel.canvas_width <= 0 || panel.canvas_height <= 0) {
        throw ConfigError("Canvas size must be positive");
    }
    if (resolved_layout().max_line_width <= 0) {
        throw ConfigError("Canvas too narrow for the panel padding");
    }
    if (!(job.max_duration > 0.0)) {
        throw ConfigError("Maximum duration must be positive");
    }
}

} // namespace tirgum
