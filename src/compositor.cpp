#include "tirgum/compositor.h"
#include "tirgum/errors.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace tirgum {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << seconds;
    return ss.str();
}

// Last lines of ffmpeg's log are the ones that name the failure
std::string tail(const std::string& text, size_t max_chars = 2000) {
    if (text.size() <= max_chars) {
        return text;
    }
    return "..." + text.substr(text.size() - max_chars);
}

std::filesystem::path make_overlay_dir(const std::string& work_dir) {
    static std::atomic<unsigned> counter{0};

    std::filesystem::path base = work_dir.empty()
        ? std::filesystem::temp_directory_path()
        : std::filesystem::path(work_dir);

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = base / ("tirgum_overlays_" + std::to_string(getpid()) + "_" +
                                        std::to_string(stamp) + "_" + std::to_string(counter++));

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw Error("Cannot create overlay directory " + dir.string() + ": " + ec.message());
    }
    return dir;
}

// Removes the overlay directory on scope exit
struct OverlayDir {
    std::filesystem::path path;
    bool keep;

    ~OverlayDir() {
        if (keep) {
            std::cout << "[Tirgum] Keeping overlay images in " << path.string() << "\n";
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            std::cerr << "[Tirgum] Failed to remove " << path.string() << ": " << ec.message() << "\n";
        }
    }
};

} // namespace

FfmpegCompositor::FfmpegCompositor(const CompositorOptions& options, CommandRunner runner)
    : options_(options), runner_(std::move(runner))
{
    if (!runner_) {
        throw ConfigError("FfmpegCompositor requires a command runner");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

void FfmpegCompositor::append_encoder_args(std::vector<std::string>& args) const {
    args.insert(args.end(), {
        "-c:v", options_.video_codec,
        "-c:a", "copy",
        "-pix_fmt", options_.pixel_format,
        "-preset", options_.preset,
        "-crf", std::to_string(options_.crf),
        "-strict", "experimental",
    });
    if (options_.duration_limit > 0.0) {
        args.push_back("-t");
        args.push_back(format_seconds(options_.duration_limit));
    }
}

std::vector<std::string> FfmpegCompositor::burn_command(const std::string& video_path,
                                                        const std::string& subtitle_path,
                                                        const std::string& output_path) const {
    std::vector<std::string> args = {options_.ffmpeg_binary, "-y", "-i", video_path};

    args.push_back("-vf");
    args.push_back("subtitles=" + quote_filter_value(subtitle_path) +
                   ":force_style=" + quote_filter_value(force_style(options_)));

    append_encoder_args(args);
    args.push_back(output_path);
    return args;
}

std::vector<std::string> FfmpegCompositor::overlay_command(const std::string& video_path,
                                                           const std::vector<std::string>& image_paths,
                                                           const std::vector<RasterOverlay>& overlays,
                                                           const std::string& output_path) const {
    if (image_paths.size() != overlays.size()) {
        throw Error("Overlay image count does not match overlay count");
    }

    std::vector<std::string> args = {options_.ffmpeg_binary, "-y", "-i", video_path};
    for (const auto& image : image_paths) {
        args.push_back("-i");
        args.push_back(image);
    }

    if (!overlays.empty()) {
        std::ostringstream graph;
        std::string previous = "[0:v]";
        for (size_t i = 0; i < overlays.size(); ++i) {
            const auto& overlay = overlays[i];
            const std::string label = "[v" + std::to_string(i + 1) + "]";
            if (i > 0) graph << ";";
            graph << previous << "[" << (i + 1) << ":v]overlay=x=" << overlay.x
                  << ":y=" << overlay.y
                  << ":enable='between(t," << format_seconds(overlay.start) << ","
                  << format_seconds(overlay.start + overlay.duration) << ")'"
                  << label;
            previous = label;
        }

        args.insert(args.end(), {"-filter_complex", graph.str(), "-map", previous, "-map", "0:a?"});
    }

    append_encoder_args(args);
    args.push_back(output_path);
    return args;
}

std::string FfmpegCompositor::force_style(const CompositorOptions& options) {
    std::ostringstream ss;
    ss << "Fontname=" << options.font_name
       << ",FontSize=" << options.font_size
       << ",Alignment=" << options.alignment
       << ",Outline=" << options.outline
       << ",Shadow=" << options.shadow
       << ",MarginV=" << options.margin_v;
    return ss.str();
}

std::string FfmpegCompositor::quote_filter_value(const std::string& value) {
    // Nothing is special inside '...'; a literal quote closes, escapes and reopens
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string FfmpegCompositor::shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// ═══════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════

CommandOutput FfmpegCompositor::run_command(const std::vector<std::string>& args) {
    std::string command;
    for (const auto& arg : args) {
        if (!command.empty()) command += " ";
        command += shell_quote(arg);
    }
    command += " 2>&1";

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw ServiceError(args.empty() ? "command" : args.front(), "failed to start process");
    }

    CommandOutput result;
    char buffer[1024];
    while (fgets(buffer, sizeof buffer, pipe) != nullptr) {
        result.output += buffer;
    }

    const int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

void FfmpegCompositor::run(const std::vector<std::string>& args) const {
    CommandOutput result = runner_(args);
    if (result.exit_code != 0) {
        std::cerr << "[Tirgum] ffmpeg failed with exit code " << result.exit_code << "\n";
        throw ServiceError("ffmpeg", "encoding failed (exit code " + std::to_string(result.exit_code) +
                           "): " + tail(result.output), result.exit_code);
    }
}

void FfmpegCompositor::burn_subtitles(const std::string& video_path,
                                      const std::string& subtitle_path,
                                      const std::string& output_path) {
    std::cout << "[Tirgum] Burning subtitles " << subtitle_path << " into " << output_path << "\n";
    run(burn_command(video_path, subtitle_path, output_path));
}

void FfmpegCompositor::composite_overlays(const std::string& video_path,
                                          const std::vector<RasterOverlay>& overlays,
                                          const std::string& output_path) {
    OverlayDir dir{make_overlay_dir(work_dir_), keep_temp_files_};

    std::vector<std::string> image_paths;
    image_paths.reserve(overlays.size());
    for (size_t i = 0; i < overlays.size(); ++i) {
        std::string path = (dir.path / ("overlay_" + std::to_string(i) + ".pam")).string();
        write_pam(overlays[i], path);
        image_paths.push_back(std::move(path));
    }

    std::cout << "[Tirgum] Compositing " << overlays.size() << " overlay(s) into " << output_path << "\n";
    run(overlay_command(video_path, image_paths, overlays, output_path));
}

void FfmpegCompositor::write_pam(const RasterOverlay& overlay, const std::string& path) {
    const size_t expected = static_cast<size_t>(overlay.width) * overlay.height * 4;
    if (overlay.width <= 0 || overlay.height <= 0 || overlay.pixels.size() != expected) {
        throw Error("Malformed overlay bitmap for " + path);
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw Error("Cannot write overlay image: " + path);
    }

    file << "P7\n"
         << "WIDTH " << overlay.width << "\n"
         << "HEIGHT " << overlay.height << "\n"
         << "DEPTH 4\n"
         << "MAXVAL 255\n"
         << "TUPLTYPE RGB_ALPHA\n"
         << "ENDHDR\n";
    file.write(reinterpret_cast<const char*>(overlay.pixels.data()),
               static_cast<std::streamsize>(overlay.pixels.size()));

    if (!file) {
        throw Error("Failed to write overlay image: " + path);
    }
}

} // namespace tirgum
