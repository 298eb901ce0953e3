#pragma once

#include "compositor.h"
#include "config.h"
#include "export.h"
#include "glyph_metrics.h"
#include "pipeline.h"
#include "services.h"
#include "types.h"
#include <functional>
#include <string>

namespace tirgum {

/**
 * @brief Progress callback: stage number (1-based), stage count, message
 */
using ProgressCallback = std::function<void(int stage, int total, const std::string& message)>;

/**
 * @brief Outcome of one subtitle job
 */
struct JobResult {
    std::string output_path;                // Rendered video
    std::string subtitle_path;              // Kept SRT (empty when removed or unused)
    std::string metadata_path;              // Empty when metadata is disabled
    TranscribeResult transcript;
    PipelineResult pipeline;
    bool fell_back_to_full_text = false;    // Segment count mismatch was recovered
};

/**
 * @brief End-to-end subtitle job
 *
 * Stages:
 *   1/4 duration check and transcription
 *   2/4 translation (one batch entry per segment, or the full transcript
 *       when no segment timing exists)
 *   3/4 reconcile, wrap and build subtitle blocks
 *   4/4 hand the SRT or the raster overlays to the compositor, then write
 *       the job metadata
 *
 * A segmented translation whose length does not match the segment count is
 * recovered by joining it into one block of text and mapping sentence
 * chunks instead; the fallback is logged and reported in the result.
 * Temporary files (the SRT handed to the burn-in filter, the compositor's
 * overlay images) go under JobOptions::work_dir and are removed on every
 * exit path unless JobOptions::keep_temp_files is set.
 *
 * Collaborators are borrowed and must outlive the job.
 */
class TIRGUM_API SubtitleJob {
public:
    /**
     * @throws ConfigError if the configuration is invalid
     */
    SubtitleJob(TranscriptionService& transcription,
                TranslationService& translation,
                VideoCompositor& compositor,
                const GlyphMetrics& metrics,
                const EngineConfig& config);

    /**
     * @brief Run every stage for one video
     *
     * @param video_duration Known duration in seconds (<= 0 = take it from the transcript)
     * @throws DurationLimitError if the video is longer than JobOptions::max_duration
     * @throws EmptyTranscriptError if transcription or translation yields no text
     * @throws ServiceError if a collaborator fails
     * @throws FontResolutionError if the font cannot render the translation
     */
    JobResult run(const std::string& video_path,
                  double video_duration,
                  const std::string& output_path,
                  const ProgressCallback& progress = nullptr);

    /**
     * @brief Ask the translation service for the transcript's text
     *
     * Segmented when segment timing exists, full text otherwise.
     *
     * @throws EmptyTranscriptError if the translation is blank
     */
    TranslationUnit translate(const TranscribeResult& transcript);

    const SubtitlePipeline& pipeline() const { return pipeline_; }

private:
    PipelineResult build_blocks(const TranscribeResult& transcript,
                                const TranslationUnit& translation,
                                double duration,
                                bool& fell_back) const;

    std::string write_temp_subtitles(const std::string& video_path,
                                     const std::vector<SubtitleBlock>& blocks) const;

    TranscriptionService& transcription_;
    TranslationService& translation_;
    VideoCompositor& compositor_;
    EngineConfig config_;
    SubtitlePipeline pipeline_;
};

} // namespace tirgum
