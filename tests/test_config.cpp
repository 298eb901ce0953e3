#include <gtest/gtest.h>

#include <tirgum/config.h>
#include <tirgum/errors.h>
#include <map>

using namespace tirgum;

namespace {

EngineConfig::EnvLookup env(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(EngineConfigTest, DefaultsWithoutEnvironment) {
    EngineConfig config = EngineConfig::from_environment(env({}));

    EXPECT_EQ(config.font.pixel_size, 28);
    EXPECT_EQ(config.font.candidates.front(), "fonts/NotoSansHebrew-Regular.ttf");
    EXPECT_EQ(config.layout.stroke_width, 2);
    EXPECT_EQ(config.panel.canvas_width, 1280);
    EXPECT_DOUBLE_EQ(config.job.max_duration, 300.0);
    EXPECT_EQ(config.job.source_language, "en");
    EXPECT_EQ(config.job.target_language, "he");
    EXPECT_EQ(config.job.output_mode, OutputMode::SubtitleFile);
    EXPECT_EQ(config.compositor.ffmpeg_binary, "ffmpeg");
    EXPECT_EQ(config.compositor.crf, 23);
    EXPECT_EQ(config.compositor.preset, "ultrafast");
}

TEST(EngineConfigTest, EnvironmentOverridesDefaults) {
    EngineConfig config = EngineConfig::from_environment(env({
        {"TIRGUM_FONT_PATHS", "/a.ttf::/b.ttf"},
        {"TIRGUM_FONT_SIZE", "32"},
        {"TIRGUM_STROKE_WIDTH", "3"},
        {"TIRGUM_CANVAS_WIDTH", "1920"},
        {"TIRGUM_CANVAS_HEIGHT", "1080"},
        {"TIRGUM_BOTTOM_MARGIN", "60"},
        {"TIRGUM_MAX_DURATION", "120.5"},
        {"TIRGUM_TARGET_LANG", "ar"},
        {"TIRGUM_OUTPUT_MODE", "overlay"},
        {"TIRGUM_FFMPEG", "/opt/ffmpeg/bin/ffmpeg"},
    }));

    ASSERT_EQ(config.font.candidates.size(), 2u);
    EXPECT_EQ(config.font.candidates[0], "/a.ttf");
    EXPECT_EQ(config.font.candidates[1], "/b.ttf");
    EXPECT_EQ(config.font.pixel_size, 32);
    EXPECT_EQ(config.compositor.font_size, 32);
    EXPECT_EQ(config.layout.stroke_width, 3);
    EXPECT_EQ(config.compositor.outline, 3);
    EXPECT_EQ(config.panel.canvas_width, 1920);
    EXPECT_EQ(config.panel.canvas_height, 1080);
    EXPECT_EQ(config.panel.bottom_margin, 60);
    EXPECT_EQ(config.compositor.margin_v, 60);
    EXPECT_DOUBLE_EQ(config.job.max_duration, 120.5);
    EXPECT_DOUBLE_EQ(config.compositor.duration_limit, 120.5);
    EXPECT_EQ(config.job.target_language, "ar");
    EXPECT_EQ(config.job.output_mode, OutputMode::RasterOverlay);
    EXPECT_EQ(config.compositor.ffmpeg_binary, "/opt/ffmpeg/bin/ffmpeg");
}

TEST(EngineConfigTest, MalformedNumbersThrow) {
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_FONT_SIZE", "large"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_FONT_SIZE", "28px"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_MAX_DURATION", "5min"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_CANVAS_WIDTH", "99999999999999"}})),
                 ConfigError);
}

TEST(EngineConfigTest, OutOfRangeValuesThrow) {
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_FONT_SIZE", "0"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_STROKE_WIDTH", "-1"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_MAX_DURATION", "0"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_CANVAS_WIDTH", "40"}})), ConfigError);
    EXPECT_THROW(EngineConfig::from_environment(env({{"TIRGUM_OUTPUT_MODE", "hologram"}})), ConfigError);
}

TEST(EngineConfigTest, LineWidthResolvesAgainstTheCanvas) {
    EngineConfig config;
    EXPECT_EQ(config.resolved_layout().max_line_width, 1280 - 2 * 20);

    config.layout.max_line_width = 600;
    EXPECT_EQ(config.resolved_layout().max_line_width, 600);
}
