#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Subtitle format types
 */
enum class SubtitleFormat {
    SRT,        // SubRip (.srt) - consumed by the burn-in filter
    VTT         // WebVTT (.vtt) - web standard
};

/**
 * @brief Subtitle export configuration
 */
struct SubtitleExportOptions {
    SubtitleFormat format = SubtitleFormat::SRT;

    // Write the wrapped lines of each block (joined by newlines) instead of
    // the segment text. Lines are written in logical order either way.
    bool use_wrapped_lines = false;

    std::string output_path;               // Output file path (empty = auto-generate)
};

/**
 * @brief Subtitle entry
 */
struct SubtitleEntry {
    int index;                             // Subtitle number (1-based)
    double start;                          // Start time (seconds)
    double end;                            // End time (seconds)
    std::string text;                      // Subtitle text

    SubtitleEntry() : index(0), start(0.0), end(0.0) {}
};

/**
 * @brief Format seconds as HH:MM:SS,mmm
 *
 * Milliseconds are truncated, not rounded. Hours widen past two digits
 * instead of wrapping. Negative input renders as zero.
 */
TIRGUM_API std::string format_time(double seconds);

/**
 * @brief Subtitle Exporter
 *
 * Writes subtitle blocks (or plain segments) as SubRip or WebVTT text.
 * The SRT output is byte-for-byte reproducible for the same input:
 * sequential index from 1, "start --> end", the text, and a blank line
 * between entries.
 *
 * Example usage:
 * @code
 * tirgum::SubtitleExporter exporter;
 * exporter.export_srt(blocks, "video.mp4");  // Creates video.srt
 * @endcode
 */
class TIRGUM_API SubtitleExporter {
public:
    SubtitleExporter() = default;
    ~SubtitleExporter() = default;

    // ═══════════════════════════════════════════════════════════
    // High-level Export
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Export subtitles in the format selected by the options
     *
     * Output path auto-generated from video_path if not specified in options.
     *
     * @return Output file path
     * @throws Error if the file cannot be written
     */
    std::string export_subtitles(const std::vector<SubtitleBlock>& blocks,
                                 const std::string& video_path,
                                 const SubtitleExportOptions& options = SubtitleExportOptions());

    std::string export_srt(const std::vector<SubtitleBlock>& blocks,
                           const std::string& video_path,
                           const SubtitleExportOptions& options = SubtitleExportOptions());

    std::string export_vtt(const std::vector<SubtitleBlock>& blocks,
                           const std::string& video_path,
                           const SubtitleExportOptions& options = SubtitleExportOptions());

    // ═══════════════════════════════════════════════════════════
    // Low-level Formatting
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Convert blocks to subtitle entries (index from 1, input order)
     */
    static std::vector<SubtitleEntry> blocks_to_entries(
        const std::vector<SubtitleBlock>& blocks,
        const SubtitleExportOptions& options);

    /**
     * @brief Convert segments to subtitle entries (index from 1, input order)
     */
    static std::vector<SubtitleEntry> segments_to_entries(const std::vector<Segment>& segments);

    /**
     * @brief Render a complete SRT document
     */
    static std::string format_srt(const std::vector<SubtitleEntry>& entries);

    /**
     * @brief Render a complete WebVTT document (header included)
     */
    static std::string format_vtt(const std::vector<SubtitleEntry>& entries);

    static std::string format_srt_entry(const SubtitleEntry& entry);
    static std::string format_vtt_entry(const SubtitleEntry& entry);

    // ═══════════════════════════════════════════════════════════
    // Parsing
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Parse SRT text into segments
     *
     * Tolerates a UTF-8 BOM, CRLF line endings and '.' as millisecond
     * separator. Multi-line cue text is joined with '\n'.
     *
     * @throws InvalidSegmentError on a malformed timing line
     */
    static std::vector<Segment> parse_srt(const std::string& content);

    /**
     * @brief Load and parse an SRT file
     * @throws Error if the file cannot be read
     */
    static std::vector<Segment> load_srt(const std::string& path);

    /**
     * @brief Parse HH:MM:SS,mmm (or HH:MM:SS.mmm) to seconds
     * @throws InvalidSegmentError if the timestamp is malformed
     */
    static double parse_srt_timestamp(const std::string& timestamp);

    // ═══════════════════════════════════════════════════════════
    // Utilities
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Generate output path from video path (same directory, new extension)
     */
    static std::string generate_output_path(const std::string& video_path,
                                            SubtitleFormat format);

    /**
     * @brief Format time for SRT (HH:MM:SS,mmm)
     */
    static std::string format_srt_timestamp(double seconds);

    /**
     * @brief Format time for VTT (HH:MM:SS.mmm)
     */
    static std::string format_vtt_timestamp(double seconds);
};

/**
 * @brief Job metadata written next to the rendered video
 */
struct JobMetadata {
    std::string video_file;
    std::string source_language;
    std::string target_language;
    std::string reconcile_mode;            // "exact", "sentence_chunks", "whole_text"
    double duration = 0.0;
    std::vector<Segment> original;
    std::vector<Segment> translated;
};

namespace SubtitleMetadata {
    /**
     * @brief Serialize job metadata as JSON
     */
    TIRGUM_API std::string to_json(const JobMetadata& metadata);

    /**
     * @brief Write <video_name>_metadata.json beside the video
     *
     * @return Metadata JSON file path
     * @throws Error if the file cannot be written
     */
    TIRGUM_API std::string generate_metadata_json(const JobMetadata& metadata,
                                                  const std::string& video_path);
}

} // namespace tirgum
