#include "tirgum/layout.h"
#include "tirgum/bidi.h"
#include <iostream>
#include <sstream>

namespace tirgum {

LayoutEngine::LayoutEngine(const GlyphMetrics& metrics, const LayoutOptions& options)
    : metrics_(metrics), options_(options)
{
    if (options_.max_line_width <= 0) {
        throw ConfigError("Layout max_line_width must be positive, got " +
                          std::to_string(options_.max_line_width));
    }
    if (options_.stroke_width < 0) {
        throw ConfigError("Layout stroke_width must not be negative");
    }
}

std::vector<std::string> LayoutEngine::tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

Line LayoutEngine::make_line(const std::string& logical_text, TextDirection direction) const {
    Line line;
    line.logical_text = logical_text;
    line.text = to_visual_order(logical_text, options_.shape_arabic, direction);

    TextExtent extent = metrics_.measure(line.text, options_.stroke_width);
    line.width = extent.width;
    line.height = extent.height;
    return line;
}

LayoutResult LayoutEngine::wrap(const std::string& logical_text) const {
    LayoutResult result;
    const std::vector<std::string> words = tokenize(logical_text);
    if (words.empty()) {
        return result;
    }

    auto close_line = [&](Line line) {
        if (line.width > options_.max_line_width) {
            // Only reachable for a line holding a single word
            line.overflow = true;
            result.warnings.push_back({line.logical_text, line.width, options_.max_line_width});
            std::cerr << "[Tirgum] Word wider than the line (" << line.width << "px > "
                      << options_.max_line_width << "px), emitting it on its own line: "
                      << line.logical_text << "\n";
        }
        result.lines.push_back(std::move(line));
    };

    // Every line is reordered at the paragraph's level, not its own
    const TextDirection direction = paragraph_direction(logical_text);

    Line current = make_line(words[0], direction);

    for (size_t i = 1; i < words.size(); ++i) {
        Line candidate = make_line(current.logical_text + " " + words[i], direction);

        if (candidate.width > options_.max_line_width) {
            close_line(std::move(current));
            current = make_line(words[i], direction);
        } else {
            current = std::move(candidate);
        }
    }

    close_line(std::move(current));
    return result;
}

} // namespace tirgum
