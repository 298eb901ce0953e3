/**
 * @file subtitle_burn.cpp
 * @brief Lay out a translated transcript and render it as subtitles
 *
 * Reads the original segment timing from an SRT file and the translation
 * from a text file, reconciles the two, wraps every segment for the
 * configured canvas and writes the result as SRT/WebVTT, as PAM overlay
 * images, or straight into a video through ffmpeg.
 *
 * Usage:
 *   subtitle_burn <segments.srt> <translation.txt> [options]
 *
 * Options:
 *   --segmented        One translated line per segment (default: free text)
 *   --duration <s>     Media duration, used when the SRT has no cues
 *   --out <file>       Subtitle output (default: stdout)
 *   --vtt              Write WebVTT instead of SRT
 *   --wrapped          Write the wrapped lines instead of the segment text
 *   --overlays <dir>   Also write one PAM overlay per subtitle block
 *   --video <file>     Source video to burn into (requires --output)
 *   --output <file>    Rendered video
 *
 * Layout, font and ffmpeg settings come from the TIRGUM_* environment
 * variables (see tirgum/config.h).
 *
 * Example:
 *   TIRGUM_OUTPUT_MODE=overlay subtitle_burn talk.srt talk.he.txt --segmented \
 *       --video talk.mp4 --output talk_he.mp4
 */

#include <tirgum/compositor.h>
#include <tirgum/config.h>
#include <tirgum/errors.h>
#include <tirgum/font_provider.h>
#include <tirgum/pipeline.h>
#include <tirgum/subtitle_export.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <segments.srt> <translation.txt> [options]\n\n"
              << "Options:\n"
              << "  --segmented        One translated line per segment\n"
              << "  --duration <s>     Media duration, used when the SRT has no cues\n"
              << "  --out <file>       Subtitle output (default: stdout)\n"
              << "  --vtt              Write WebVTT instead of SRT\n"
              << "  --wrapped          Write the wrapped lines instead of the segment text\n"
              << "  --overlays <dir>   Also write one PAM overlay per subtitle block\n"
              << "  --video <file>     Source video to burn into (requires --output)\n"
              << "  --output <file>    Rendered video\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw tirgum::Error("Cannot open " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

tirgum::TranslationUnit load_translation(const std::string& path, bool segmented) {
    std::string content = read_file(path);
    if (!segmented) {
        return tirgum::FullText{content};
    }

    tirgum::SegmentedText texts;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        texts.texts.push_back(line);
    }
    return texts;
}

std::string join(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) result += " ";
        result += part;
    }
    return result;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string srt_path = argv[1];
    const std::string translation_path = argv[2];

    bool segmented = false;
    bool vtt = false;
    bool wrapped = false;
    double duration = 0.0;
    std::string out_path;
    std::string overlay_dir;
    std::string video_path;
    std::string video_output;

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                print_usage(argv[0]);
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--segmented") {
            segmented = true;
        } else if (arg == "--vtt") {
            vtt = true;
        } else if (arg == "--wrapped") {
            wrapped = true;
        } else if (arg == "--duration") {
            duration = std::atof(value().c_str());
        } else if (arg == "--out") {
            out_path = value();
        } else if (arg == "--overlays") {
            overlay_dir = value();
        } else if (arg == "--video") {
            video_path = value();
        } else if (arg == "--output") {
            video_output = value();
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (video_path.empty() != video_output.empty()) {
        std::cerr << "--video and --output must be given together\n";
        return 1;
    }

    try {
        tirgum::EngineConfig config = tirgum::EngineConfig::from_environment();
        auto font = tirgum::FontResolver::resolve(config.font);
        tirgum::SubtitlePipeline pipeline(*font, config);

        std::vector<tirgum::Segment> segments = tirgum::SubtitleExporter::load_srt(srt_path);
        tirgum::TranslationUnit translation = load_translation(translation_path, segmented);

        tirgum::PipelineResult result;
        try {
            result = pipeline.run(segments, translation, duration);
        } catch (const tirgum::CountMismatchError& e) {
            std::cerr << "Warning: " << e.what() << ", mapping sentence chunks instead\n";
            tirgum::FullText joined{join(std::get<tirgum::SegmentedText>(translation).texts)};
            result = pipeline.run(segments, joined, duration);
        }

        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: '" << warning.word << "' is " << warning.width
                      << "px wide (max " << warning.max_width << "px)\n";
        }

        tirgum::SubtitleExporter exporter;
        tirgum::SubtitleExportOptions export_options;
        export_options.format = vtt ? tirgum::SubtitleFormat::VTT : tirgum::SubtitleFormat::SRT;
        export_options.use_wrapped_lines = wrapped;
        export_options.output_path = out_path;

        if (out_path.empty()) {
            std::cout << (vtt ? pipeline.to_vtt(result.blocks, wrapped)
                              : pipeline.to_srt(result.blocks, wrapped));
        } else {
            exporter.export_subtitles(result.blocks, video_path, export_options);
        }

        std::vector<tirgum::RasterOverlay> overlays;
        const bool need_overlays = !overlay_dir.empty() ||
            (!video_path.empty() && config.job.output_mode == tirgum::OutputMode::RasterOverlay);
        if (need_overlays) {
            overlays = pipeline.rasterize(result.blocks);
        }

        if (!overlay_dir.empty()) {
            std::filesystem::create_directories(overlay_dir);
            for (size_t i = 0; i < overlays.size(); ++i) {
                std::string path = (std::filesystem::path(overlay_dir) /
                                    ("block_" + std::to_string(i + 1) + ".pam")).string();
                tirgum::FfmpegCompositor::write_pam(overlays[i], path);
            }
            std::cerr << "Wrote " << overlays.size() << " overlay image(s) to " << overlay_dir << "\n";
        }

        if (!video_path.empty()) {
            tirgum::FfmpegCompositor compositor(config.compositor);
            compositor.set_temp_files(config.job.work_dir, config.job.keep_temp_files);

            if (config.job.output_mode == tirgum::OutputMode::RasterOverlay) {
                compositor.composite_overlays(video_path, overlays, video_output);
            } else {
                std::string srt_for_burn = out_path;
                if (srt_for_burn.empty() || vtt) {
                    // <output>.srt beside the rendered video
                    tirgum::SubtitleExportOptions burn_options;
                    burn_options.use_wrapped_lines = wrapped;
                    srt_for_burn = exporter.export_srt(result.blocks, video_output, burn_options);
                }
                compositor.burn_subtitles(video_path, srt_for_burn, video_output);
            }
            std::cerr << "Rendered " << video_output << "\n";
        }

    } catch (const tirgum::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
