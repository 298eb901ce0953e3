#include "tirgum/subtitle_export.h"
#include "tirgum/errors.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace tirgum {

namespace {

std::string format_timestamp(double seconds, char millis_separator) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }

    // Epsilon absorbs representation error only (3725.4 * 1000 may land on 3725399.99...)
    const long long total_ms = static_cast<long long>(std::floor(seconds * 1000.0 + 1e-6));
    const long long hours = total_ms / 3600000;
    const int minutes = static_cast<int>((total_ms / 60000) % 60);
    const int secs = static_cast<int>((total_ms / 1000) % 60);
    const int millis = static_cast<int>(total_ms % 1000);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << millis_separator
        << std::setw(3) << millis;

    return oss.str();
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_index_line(const std::string& line) {
    return !line.empty() &&
           std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string block_text(const SubtitleBlock& block, bool use_wrapped_lines) {
    if (!use_wrapped_lines || block.lines.empty()) {
        return block.segment.text;
    }

    std::string text;
    for (size_t i = 0; i < block.lines.size(); ++i) {
        if (i > 0) text += "\n";
        text += block.lines[i].logical_text;
    }
    return text;
}

void write_file(const std::string& path, const std::string& content, const char* kind) {
    std::ofstream file(path, std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        throw Error(std::string("Failed to create ") + kind + " file: " + path);
    }
    file << content;
    file.close();
    if (!file) {
        throw Error(std::string("Failed to write ") + kind + " file: " + path);
    }
}

} // namespace

std::string format_time(double seconds) {
    return format_timestamp(seconds, ',');
}

// ═══════════════════════════════════════════════════════════
// High-level Export
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::export_subtitles(const std::vector<SubtitleBlock>& blocks,
                                               const std::string& video_path,
                                               const SubtitleExportOptions& options) {
    switch (options.format) {
        case SubtitleFormat::SRT:
            return export_srt(blocks, video_path, options);
        case SubtitleFormat::VTT:
            return export_vtt(blocks, video_path, options);
        default:
            throw Error("Unsupported subtitle format");
    }
}

std::string SubtitleExporter::export_srt(const std::vector<SubtitleBlock>& blocks,
                                         const std::string& video_path,
                                         const SubtitleExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(video_path, SubtitleFormat::SRT) :
        options.output_path;

    write_file(output_path, format_srt(blocks_to_entries(blocks, options)), "SRT");

    std::cout << "[Tirgum] Wrote " << blocks.size() << " subtitle entries to " << output_path << "\n";
    return output_path;
}

std::string SubtitleExporter::export_vtt(const std::vector<SubtitleBlock>& blocks,
                                         const std::string& video_path,
                                         const SubtitleExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(video_path, SubtitleFormat::VTT) :
        options.output_path;

    write_file(output_path, format_vtt(blocks_to_entries(blocks, options)), "VTT");

    std::cout << "[Tirgum] Wrote " << blocks.size() << " subtitle cues to " << output_path << "\n";
    return output_path;
}

// ═══════════════════════════════════════════════════════════
// Entry Conversion
// ═══════════════════════════════════════════════════════════

std::vector<SubtitleEntry> SubtitleExporter::blocks_to_entries(
    const std::vector<SubtitleBlock>& blocks,
    const SubtitleExportOptions& options) {

    std::vector<SubtitleEntry> entries;
    entries.reserve(blocks.size());
    int entry_index = 1;

    for (const auto& block : blocks) {
        SubtitleEntry entry;
        entry.index = entry_index++;
        entry.start = block.segment.start;
        entry.end = block.segment.end;
        entry.text = block_text(block, options.use_wrapped_lines);
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<SubtitleEntry> SubtitleExporter::segments_to_entries(const std::vector<Segment>& segments) {
    std::vector<SubtitleEntry> entries;
    entries.reserve(segments.size());
    int entry_index = 1;

    for (const auto& seg : segments) {
        SubtitleEntry entry;
        entry.index = entry_index++;
        entry.start = seg.start;
        entry.end = seg.end;
        entry.text = seg.text;
        entries.push_back(std::move(entry));
    }

    return entries;
}

// ═══════════════════════════════════════════════════════════
// SRT Formatting
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::format_srt(const std::vector<SubtitleEntry>& entries) {
    std::string out;
    for (const auto& entry : entries) {
        out += format_srt_entry(entry);
        out += "\n";  // Blank line between entries
    }
    return out;
}

std::string SubtitleExporter::format_srt_entry(const SubtitleEntry& entry) {
    std::ostringstream oss;

    oss << entry.index << "\n";
    oss << format_srt_timestamp(entry.start) << " --> "
        << format_srt_timestamp(entry.end) << "\n";
    oss << entry.text << "\n";

    return oss.str();
}

std::string SubtitleExporter::format_srt_timestamp(double seconds) {
    return format_timestamp(seconds, ',');
}

// ═══════════════════════════════════════════════════════════
// VTT Formatting
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::format_vtt(const std::vector<SubtitleEntry>& entries) {
    std::string out = "WEBVTT\n\n";
    for (const auto& entry : entries) {
        out += format_vtt_entry(entry);
        out += "\n";  // Blank line between cues
    }
    return out;
}

std::string SubtitleExporter::format_vtt_entry(const SubtitleEntry& entry) {
    std::ostringstream oss;

    // Cue identifier (optional in VTT, kept for parity with SRT)
    oss << entry.index << "\n";
    oss << format_vtt_timestamp(entry.start) << " --> "
        << format_vtt_timestamp(entry.end) << "\n";
    oss << entry.text << "\n";

    return oss.str();
}

std::string SubtitleExporter::format_vtt_timestamp(double seconds) {
    return format_timestamp(seconds, '.');
}

// ═══════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════

double SubtitleExporter::parse_srt_timestamp(const std::string& timestamp) {
    const std::string ts = trim(timestamp);

    int hours = 0, minutes = 0, secs = 0;
    char c1 = 0, c2 = 0, sep = 0;
    std::istringstream iss(ts);
    iss >> hours >> c1 >> minutes >> c2 >> secs >> sep;
    if (!iss || c1 != ':' || c2 != ':' || (sep != ',' && sep != '.') ||
        minutes < 0 || minutes > 59 || secs < 0 || secs > 59 || hours < 0) {
        throw InvalidSegmentError("Malformed SRT timestamp: '" + ts + "'");
    }

    std::string digits;
    iss >> digits;
    if (digits.empty() || digits.size() > 3 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw InvalidSegmentError("Malformed SRT milliseconds: '" + ts + "'");
    }
    // "4" means 400 ms, "04" means 40 ms
    while (digits.size() < 3) digits += '0';
    const int millis = std::stoi(digits);

    return hours * 3600.0 + minutes * 60.0 + secs + millis / 1000.0;
}

std::vector<Segment> SubtitleExporter::parse_srt(const std::string& content) {
    std::string text = content;

    // UTF-8 BOM
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        text.erase(0, 3);
    }

    std::vector<Segment> segments;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (!is_index_line(line)) {
            continue;
        }

        std::string timing;
        if (!std::getline(stream, timing)) {
            break;
        }
        const auto arrow = timing.find("-->");
        if (arrow == std::string::npos) {
            throw InvalidSegmentError("Missing '-->' after SRT index " + line);
        }

        Segment seg;
        seg.id = static_cast<int>(segments.size());
        seg.start = parse_srt_timestamp(timing.substr(0, arrow));
        seg.end = parse_srt_timestamp(timing.substr(arrow + 3));

        bool first = true;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) break;
            if (!first) seg.text += "\n";
            first = false;
            seg.text += line;
        }

        segments.push_back(std::move(seg));
    }

    return segments;
}

std::vector<Segment> SubtitleExporter::load_srt(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw Error("Failed to open SRT file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_srt(content);
}

// ═══════════════════════════════════════════════════════════
// Utilities
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::generate_output_path(const std::string& video_path,
                                                   SubtitleFormat format) {
    std::filesystem::path video(video_path);
    std::filesystem::path output = video.parent_path();

    std::string stem = video.stem().string();

    switch (format) {
        case SubtitleFormat::SRT:
            output /= stem + ".srt";
            break;
        case SubtitleFormat::VTT:
            output /= stem + ".vtt";
            break;
        default:
            output /= stem + ".sub";
    }

    return output.string();
}

// ═══════════════════════════════════════════════════════════
// Metadata JSON
// ═══════════════════════════════════════════════════════════

namespace SubtitleMetadata {

// Helper: Escape JSON string
static std::string escape_json_string(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Control character - use \uXXXX format
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

static void write_segments(std::ostringstream& json, const std::vector<Segment>& segments) {
    json << "[\n";
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        json << "    {\n";
        json << "      \"start\": " << seg.start << ",\n";
        json << "      \"end\": " << seg.end << ",\n";
        json << "      \"text\": \"" << escape_json_string(seg.text) << "\"\n";
        json << "    }" << (i + 1 < segments.size() ? "," : "") << "\n";
    }
    json << "  ]";
}

std::string to_json(const JobMetadata& metadata) {
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::system_clock::to_time_t(now);

    std::ostringstream json;
    json << std::setprecision(3) << std::fixed;

    json << "{\n";
    json << "  \"video_file\": \"" << escape_json_string(metadata.video_file) << "\",\n";
    json << "  \"processed_date\": " << timestamp << ",\n";
    json << "  \"engine\": \"tirgum\",\n";
    json << "  \"source_language\": \"" << escape_json_string(metadata.source_language) << "\",\n";
    json << "  \"target_language\": \"" << escape_json_string(metadata.target_language) << "\",\n";
    json << "  \"reconcile_mode\": \"" << escape_json_string(metadata.reconcile_mode) << "\",\n";
    json << "  \"duration\": " << metadata.duration << ",\n";
    json << "  \"original\": ";
    write_segments(json, metadata.original);
    json << ",\n";
    json << "  \"translated\": ";
    write_segments(json, metadata.translated);
    json << "\n";
    json << "}\n";

    return json.str();
}

std::string generate_metadata_json(const JobMetadata& metadata, const std::string& video_path) {
    std::filesystem::path video(video_path);
    std::filesystem::path metadata_path = video.parent_path();
    metadata_path /= video.stem().string() + "_metadata.json";

    write_file(metadata_path.string(), to_json(metadata), "metadata JSON");

    return metadata_path.string();
}

} // namespace SubtitleMetadata

} // namespace tirgum
