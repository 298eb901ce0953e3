#include "tirgum/subtitle_job.h"
#include "tirgum/errors.h"
#include "tirgum/subtitle_export.h"
#include <atomic>
#include <filesystem>
#include <iostream>

#include <unistd.h>

namespace tirgum {

namespace {

constexpr int STAGE_COUNT = 4;

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string join(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (is_blank(part)) continue;
        if (!result.empty()) result += " ";
        result += part;
    }
    return result;
}

// Removes a temporary file on scope exit
struct TempFile {
    std::string path;
    bool keep = false;

    ~TempFile() {
        if (path.empty() || keep) return;
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            std::cerr << "[Tirgum] Failed to remove temporary file " << path << ": " << ec.message() << "\n";
        }
    }
};

} // namespace

SubtitleJob::SubtitleJob(TranscriptionService& transcription,
                         TranslationService& translation,
                         VideoCompositor& compositor,
                         const GlyphMetrics& metrics,
                         const EngineConfig& config)
    : transcription_(transcription),
      translation_(translation),
      compositor_(compositor),
      config_(config),
      pipeline_(metrics, config)
{}

JobResult SubtitleJob::run(const std::string& video_path,
                           double video_duration,
                           const std::string& output_path,
                           const ProgressCallback& progress) {
    auto report = [&](int stage, const std::string& message) {
        std::cout << "[Tirgum] " << stage << "/" << STAGE_COUNT << " " << message << "\n";
        if (progress) {
            progress(stage, STAGE_COUNT, message);
        }
    };

    const double limit = config_.job.max_duration;
    if (video_duration > limit) {
        std::cerr << "[Tirgum] Rejecting " << video_path << ": " << video_duration
                  << "s exceeds the " << limit << "s limit\n";
        throw DurationLimitError(video_duration, limit);
    }

    JobResult result;
    result.output_path = output_path;

    // ═══════════════════════════════════════════════════════════
    // Stage 1: Transcription
    // ═══════════════════════════════════════════════════════════

    report(1, "Video received, transcribing audio");
    result.transcript = transcription_.transcribe(video_path);

    const double duration = video_duration > 0.0 ? video_duration : result.transcript.duration;
    if (duration > limit) {
        throw DurationLimitError(duration, limit);
    }

    bool has_text = !is_blank(result.transcript.text);
    for (const auto& seg : result.transcript.segments) {
        has_text = has_text || !is_blank(seg.text);
    }
    if (!has_text) {
        throw EmptyTranscriptError("No speech was transcribed from " + video_path);
    }

    std::cout << "[Tirgum] Transcribed " << result.transcript.segments.size() << " segment(s), "
              << "language=" << (result.transcript.language.empty() ? config_.job.source_language
                                                                     : result.transcript.language)
              << "\n";

    // ═══════════════════════════════════════════════════════════
    // Stage 2: Translation
    // ═══════════════════════════════════════════════════════════

    report(2, "Transcription complete, translating");
    TranslationUnit translation = translate(result.transcript);

    // ═══════════════════════════════════════════════════════════
    // Stage 3: Reconcile and lay out
    // ═══════════════════════════════════════════════════════════

    report(3, "Translation complete, rendering subtitles");
    result.pipeline = build_blocks(result.transcript, translation, duration, result.fell_back_to_full_text);
    if (result.pipeline.blocks.empty()) {
        throw EmptyTranscriptError("Translation produced no subtitle text");
    }

    // ═══════════════════════════════════════════════════════════
    // Stage 4: Composite
    // ═══════════════════════════════════════════════════════════

    compositor_.set_temp_files(config_.job.work_dir, config_.job.keep_temp_files);

    if (config_.job.output_mode == OutputMode::SubtitleFile) {
        TempFile subtitles{write_temp_subtitles(video_path, result.pipeline.blocks),
                           config_.job.keep_temp_files};
        compositor_.burn_subtitles(video_path, subtitles.path, output_path);
        if (subtitles.keep) {
            result.subtitle_path = subtitles.path;
        }
    } else {
        compositor_.composite_overlays(video_path, pipeline_.rasterize(result.pipeline.blocks), output_path);
    }
    report(4, "Subtitles rendered into " + output_path);

    if (config_.job.write_metadata) {
        JobMetadata metadata;
        metadata.video_file = video_path;
        metadata.source_language = result.transcript.language.empty() ? config_.job.source_language
                                                                      : result.transcript.language;
        metadata.target_language = config_.job.target_language;
        metadata.reconcile_mode = to_string(result.pipeline.reconciled.mode);
        metadata.duration = duration;
        metadata.original = result.transcript.segments;
        metadata.translated = result.pipeline.reconciled.segments;
        result.metadata_path = SubtitleMetadata::generate_metadata_json(metadata, output_path);
    }

    return result;
}

TranslationUnit SubtitleJob::translate(const TranscribeResult& transcript) {
    const std::string& source = transcript.language.empty() ? config_.job.source_language
                                                            : transcript.language;
    const std::string& target = config_.job.target_language;

    if (transcript.segments.empty()) {
        std::string translated = translation_.translate(transcript.text, source, target);
        if (is_blank(translated)) {
            throw EmptyTranscriptError("Translation service returned no text");
        }
        return FullText{translated};
    }

    std::vector<std::string> texts;
    texts.reserve(transcript.segments.size());
    for (const auto& seg : transcript.segments) {
        texts.push_back(seg.text);
    }

    SegmentedText translated{translation_.translate_batch(texts, source, target)};
    if (is_blank(join(translated.texts))) {
        throw EmptyTranscriptError("Translation service returned no text");
    }
    return translated;
}

PipelineResult SubtitleJob::build_blocks(const TranscribeResult& transcript,
                                         const TranslationUnit& translation,
                                         double duration,
                                         bool& fell_back) const {
    fell_back = false;
    try {
        return pipeline_.run(transcript.segments, translation, duration);
    } catch (const CountMismatchError& e) {
        std::cerr << "[Tirgum] " << e.what()
                  << "; falling back to sentence mapping of the joined translation\n";
        fell_back = true;
        FullText joined{join(std::get<SegmentedText>(translation).texts)};
        return pipeline_.run(transcript.segments, joined, duration);
    }
}

std::string SubtitleJob::write_temp_subtitles(const std::string& video_path,
                                              const std::vector<SubtitleBlock>& blocks) const {
    static std::atomic<unsigned> counter{0};

    std::filesystem::path dir = config_.job.work_dir.empty()
        ? std::filesystem::temp_directory_path()
        : std::filesystem::path(config_.job.work_dir);

    const std::string stem = std::filesystem::path(video_path).stem().string();
    std::filesystem::path path = dir / ("tirgum_" + stem + "_" + std::to_string(getpid()) + "_" +
                                        std::to_string(counter++) + ".srt");

    SubtitleExportOptions options;
    options.output_path = path.string();
    return SubtitleExporter().export_srt(blocks, video_path, options);
}

} // namespace tirgum
