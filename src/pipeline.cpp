#include "tirgum/pipeline.h"
#include "tirgum/subtitle_export.h"
#include <iostream>

namespace tirgum {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

SubtitlePipeline::SubtitlePipeline(const GlyphMetrics& metrics, const EngineConfig& config)
    : config_(validated(config)),
      layout_(metrics, config_.resolved_layout()),
      renderer_(metrics, config_.panel, config_.layout.stroke_width)
{}

PipelineResult SubtitlePipeline::run(const std::vector<Segment>& original,
                                     const TranslationUnit& translation,
                                     double media_duration) const {
    validate_segments(original);

    ReconcileOptions options;
    options.media_duration = media_duration;

    PipelineResult result;
    result.reconciled = Reconciler(options).reconcile(original, translation);
    result.blocks = layout(result.reconciled.segments, &result.warnings);

    std::cout << "[Tirgum] Laid out " << result.blocks.size() << " subtitle block(s) from "
              << result.reconciled.segments.size() << " segment(s) ("
              << to_string(result.reconciled.mode) << ")\n";
    return result;
}

std::vector<SubtitleBlock> SubtitlePipeline::layout(const std::vector<Segment>& translated,
                                                    std::vector<LayoutOverflowWarning>* warnings) const {
    std::vector<SubtitleBlock> blocks;
    blocks.reserve(translated.size());

    for (const auto& segment : translated) {
        SubtitleBlock block = layout_segment(segment, warnings);
        if (block.lines.empty()) {
            std::cerr << "[Tirgum] Segment " << segment.id << " [" << format_time(segment.start)
                      << " --> " << format_time(segment.end) << "] has no text, skipping\n";
            continue;
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

SubtitleBlock SubtitlePipeline::layout_segment(const Segment& segment,
                                               std::vector<LayoutOverflowWarning>* warnings) const {
    LayoutResult wrapped = layout_.wrap(segment.text);
    if (warnings) {
        warnings->insert(warnings->end(), wrapped.warnings.begin(), wrapped.warnings.end());
    }
    if (wrapped.lines.empty()) {
        SubtitleBlock empty;
        empty.segment = segment;
        return empty;
    }
    return renderer_.build(std::move(wrapped.lines), segment);
}

std::vector<RasterOverlay> SubtitlePipeline::rasterize(const std::vector<SubtitleBlock>& blocks) const {
    std::vector<RasterOverlay> overlays;
    overlays.reserve(blocks.size());
    for (const auto& block : blocks) {
        overlays.push_back(renderer_.rasterize(block));
    }
    return overlays;
}

std::string SubtitlePipeline::to_srt(const std::vector<SubtitleBlock>& blocks, bool use_wrapped_lines) const {
    SubtitleExportOptions options;
    options.use_wrapped_lines = use_wrapped_lines;
    return SubtitleExporter::format_srt(SubtitleExporter::blocks_to_entries(blocks, options));
}

std::string SubtitlePipeline::to_vtt(const std::vector<SubtitleBlock>& blocks, bool use_wrapped_lines) const {
    SubtitleExportOptions options;
    options.format = SubtitleFormat::VTT;
    options.use_wrapped_lines = use_wrapped_lines;
    return SubtitleExporter::format_vtt(SubtitleExporter::blocks_to_entries(blocks, options));
}

} // namespace tirgum
