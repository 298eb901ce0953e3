#include <gtest/gtest.h>

#include <tirgum/compositor.h>
#include <tirgum/errors.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tirgum;

namespace {

struct RecordingRunner {
    std::vector<std::vector<std::string>> calls;
    CommandOutput next;

    CommandRunner runner() {
        return [this](const std::vector<std::string>& args) {
            calls.push_back(args);
            return next;
        };
    }
};

RasterOverlay make_overlay(int x, int y, double start, double duration) {
    RasterOverlay overlay;
    overlay.x = x;
    overlay.y = y;
    overlay.width = 2;
    overlay.height = 1;
    overlay.pixels = {255, 0, 0, 255, 0, 0, 255, 128};
    overlay.start = start;
    overlay.duration = duration;
    return overlay;
}

std::string value_after(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

} // namespace

TEST(FfmpegCompositorTest, BurnCommand) {
    FfmpegCompositor compositor(CompositorOptions{});

    auto args = compositor.burn_command("in.mp4", "/tmp/he.srt", "out.mp4");

    const std::vector<std::string> expected = {
        "ffmpeg", "-y", "-i", "in.mp4",
        "-vf", "subtitles='/tmp/he.srt':force_style='Fontname=Noto Sans Hebrew,FontSize=28,"
               "Alignment=2,Outline=2,Shadow=1,MarginV=40'",
        "-c:v", "libx264",
        "-c:a", "copy",
        "-pix_fmt", "yuv420p",
        "-preset", "ultrafast",
        "-crf", "23",
        "-strict", "experimental",
        "-t", "300.000",
        "out.mp4",
    };
    EXPECT_EQ(args, expected);
}

TEST(FfmpegCompositorTest, NoDurationCapWhenDisabled) {
    CompositorOptions options;
    options.duration_limit = 0.0;
    FfmpegCompositor compositor(options);

    auto args = compositor.burn_command("in.mp4", "he.srt", "out.mp4");

    EXPECT_EQ(std::find(args.begin(), args.end(), "-t"), args.end());
}

TEST(FfmpegCompositorTest, BurnRunsTheCommand) {
    RecordingRunner recorder;
    FfmpegCompositor compositor(CompositorOptions{}, recorder.runner());

    compositor.burn_subtitles("in.mp4", "he.srt", "out.mp4");

    ASSERT_EQ(recorder.calls.size(), 1u);
    EXPECT_EQ(recorder.calls[0], compositor.burn_command("in.mp4", "he.srt", "out.mp4"));
}

TEST(FfmpegCompositorTest, NonZeroExitIsAServiceError) {
    RecordingRunner recorder;
    recorder.next.exit_code = 1;
    recorder.next.output = "Unable to open he.srt";
    FfmpegCompositor compositor(CompositorOptions{}, recorder.runner());

    try {
        compositor.burn_subtitles("in.mp4", "he.srt", "out.mp4");
        FAIL() << "expected ServiceError";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.service(), "ffmpeg");
        EXPECT_EQ(e.exit_code(), 1);
        EXPECT_NE(std::string(e.what()).find("Unable to open he.srt"), std::string::npos);
    }
}

TEST(FfmpegCompositorTest, OverlayChainIsEnabledPerTimeWindow) {
    FfmpegCompositor compositor(CompositorOptions{});
    std::vector<RasterOverlay> overlays = {make_overlay(570, 602, 0.0, 2.0),
                                           make_overlay(10, 20, 2.0, 2.5)};

    auto args = compositor.overlay_command("in.mp4", {"a.pam", "b.pam"}, overlays, "out.mp4");

    EXPECT_EQ(args[0], "ffmpeg");
    EXPECT_EQ(args[4], "-i");
    EXPECT_EQ(args[5], "a.pam");
    EXPECT_EQ(args[6], "-i");
    EXPECT_EQ(args[7], "b.pam");
    EXPECT_EQ(value_after(args, "-filter_complex"),
              "[0:v][1:v]overlay=x=570:y=602:enable='between(t,0.000,2.000)'[v1];"
              "[v1][2:v]overlay=x=10:y=20:enable='between(t,2.000,4.500)'[v2]");
    EXPECT_EQ(value_after(args, "-map"), "[v2]");
    EXPECT_EQ(value_after(args, "-c:v"), "libx264");
    EXPECT_EQ(args.back(), "out.mp4");
}

TEST(FfmpegCompositorTest, OverlayCountMustMatchImages) {
    FfmpegCompositor compositor(CompositorOptions{});
    EXPECT_THROW(compositor.overlay_command("in.mp4", {"a.pam"}, {}, "out.mp4"), Error);
}

TEST(FfmpegCompositorTest, CompositeWritesImagesAndCleansUp) {
    const auto work_dir = std::filesystem::temp_directory_path() / "tirgum_compositor_test";
    std::filesystem::create_directories(work_dir);

    std::vector<std::string> seen_images;
    bool images_existed = true;
    CommandRunner runner = [&](const std::vector<std::string>& args) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-i" && args[i + 1].find(".pam") != std::string::npos) {
                seen_images.push_back(args[i + 1]);
                images_existed = images_existed && std::filesystem::exists(args[i + 1]);
            }
        }
        return CommandOutput{};
    };

    FfmpegCompositor compositor(CompositorOptions{}, runner);
    compositor.set_temp_files(work_dir.string(), false);
    compositor.composite_overlays("in.mp4", {make_overlay(0, 0, 0.0, 1.0), make_overlay(0, 0, 1.0, 1.0)},
                                  "out.mp4");

    ASSERT_EQ(seen_images.size(), 2u);
    EXPECT_TRUE(images_existed);
    for (const auto& image : seen_images) {
        EXPECT_FALSE(std::filesystem::exists(image));
    }

    std::filesystem::remove_all(work_dir);
}

TEST(FfmpegCompositorTest, CompositeKeepsImagesUnderWorkDirWhenAsked) {
    const auto work_dir = std::filesystem::temp_directory_path() / "tirgum_compositor_keep_test";
    std::filesystem::create_directories(work_dir);

    std::vector<std::string> seen_images;
    CommandRunner runner = [&](const std::vector<std::string>& args) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "-i" && args[i + 1].find(".pam") != std::string::npos) {
                seen_images.push_back(args[i + 1]);
            }
        }
        return CommandOutput{};
    };

    FfmpegCompositor compositor(CompositorOptions{}, runner);
    compositor.set_temp_files(work_dir.string(), true);
    compositor.composite_overlays("in.mp4", {make_overlay(0, 0, 0.0, 1.0)}, "out.mp4");

    ASSERT_EQ(seen_images.size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(seen_images[0]));
    EXPECT_EQ(seen_images[0].rfind(work_dir.string(), 0), 0u) << seen_images[0];

    std::filesystem::remove_all(work_dir);
}

TEST(FfmpegCompositorTest, WritePam) {
    const auto path = std::filesystem::temp_directory_path() / "tirgum_overlay_test.pam";

    FfmpegCompositor::write_pam(make_overlay(0, 0, 0.0, 1.0), path.string());

    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    const std::string header = "P7\nWIDTH 2\nHEIGHT 1\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";
    ASSERT_EQ(ss.str().size(), header.size() + 8);
    EXPECT_EQ(ss.str().substr(0, header.size()), header);
    EXPECT_EQ(static_cast<unsigned char>(ss.str()[header.size() + 7]), 128);

    std::filesystem::remove(path);
}

TEST(FfmpegCompositorTest, WritePamRejectsMalformedBitmap) {
    RasterOverlay overlay = make_overlay(0, 0, 0.0, 1.0);
    overlay.pixels.pop_back();
    EXPECT_THROW(FfmpegCompositor::write_pam(overlay, "/tmp/never_written.pam"), Error);
}

TEST(FfmpegCompositorTest, Quoting) {
    EXPECT_EQ(FfmpegCompositor::quote_filter_value("it's.srt"), "'it'\\''s.srt'");
    EXPECT_EQ(FfmpegCompositor::shell_quote("a b"), "'a b'");
    EXPECT_EQ(FfmpegCompositor::shell_quote("it's"), "'it'\\''s'");
}

TEST(FfmpegCompositorTest, ForceStyleFollowsOptions) {
    CompositorOptions options;
    options.font_name = "DejaVu Sans";
    options.font_size = 32;
    options.margin_v = 60;

    EXPECT_EQ(FfmpegCompositor::force_style(options),
              "Fontname=DejaVu Sans,FontSize=32,Alignment=2,Outline=2,Shadow=1,MarginV=60");
}

TEST(FfmpegCompositorTest, DefaultRunnerCapturesOutputAndExitCode) {
    CommandOutput result = FfmpegCompositor::run_command({"sh", "-c", "echo hello; exit 3"});

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "hello\n");
}
