#include <gtest/gtest.h>

#include <tirgum/errors.h>
#include <tirgum/font_provider.h>
#include <filesystem>

using namespace tirgum;

namespace {

std::string find_system_font() {
    const char* candidates[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return "";
}

// U+10FFFD, a private-use code point no text font maps
const std::string kUnmapped = "\xF4\x8F\xBF\xBD";

} // namespace

class FreeTypeFontProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        font_path_ = find_system_font();
        if (font_path_.empty()) {
            GTEST_SKIP() << "DejaVu Sans not installed";
        }
    }

    std::string font_path_;
};

TEST_F(FreeTypeFontProviderTest, StrokeInflatesTheBox) {
    FreeTypeFontProvider font(font_path_, 28);

    TextExtent plain = font.measure("abc", 0);
    TextExtent stroked = font.measure("abc", 2);

    EXPECT_GT(plain.width, 0);
    EXPECT_EQ(stroked.width, plain.width + 4);
    EXPECT_EQ(stroked.height, plain.height + 4);
}

TEST_F(FreeTypeFontProviderTest, EmptyStringHasNoWidth) {
    FreeTypeFontProvider font(font_path_, 28);

    TextExtent extent = font.measure("", 2);

    EXPECT_EQ(extent.width, 0);
    EXPECT_GT(extent.height, 0);
}

TEST_F(FreeTypeFontProviderTest, WiderTextMeasuresWider) {
    FreeTypeFontProvider font(font_path_, 28);

    EXPECT_LT(font.measure("םולש", 2).width, font.measure("םולש םולש", 2).width);
}

TEST_F(FreeTypeFontProviderTest, RasterMatchesMeasurement) {
    FreeTypeFontProvider font(font_path_, 28);
    const Color white{255, 255, 255, 255};
    const Color black{0, 0, 0, 255};

    TextExtent extent = font.measure("םולש", 2);
    GlyphBitmap bitmap = font.rasterize("םולש", white, black, 2);

    EXPECT_EQ(bitmap.width, extent.width);
    EXPECT_EQ(bitmap.height, extent.height);
    ASSERT_EQ(bitmap.pixels.size(), static_cast<size_t>(bitmap.width) * bitmap.height * 4);

    bool any_fill = false;
    bool any_outline = false;
    for (size_t i = 0; i < bitmap.pixels.size(); i += 4) {
        if (bitmap.pixels[i + 3] == 0) continue;
        if (bitmap.pixels[i] > 200) any_fill = true;
        if (bitmap.pixels[i] < 50) any_outline = true;
    }
    EXPECT_TRUE(any_fill);
    EXPECT_TRUE(any_outline);
}

TEST_F(FreeTypeFontProviderTest, MissingGlyphIsAnError) {
    FreeTypeFontProvider font(font_path_, 28);

    EXPECT_TRUE(font.covers("abc שלום"));
    EXPECT_FALSE(font.covers(kUnmapped));
    EXPECT_THROW(font.measure("a" + kUnmapped, 2), FontResolutionError);
}

TEST_F(FreeTypeFontProviderTest, ResolverSkipsMissingCandidates) {
    FontOptions options;
    options.candidates = {"/nonexistent/font.ttf", font_path_};
    options.script_sample = "abc";

    auto font = FontResolver::resolve(options);

    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->font_path(), font_path_);
    EXPECT_EQ(font->pixel_size(), options.pixel_size);
}

TEST_F(FreeTypeFontProviderTest, ResolverRejectsFontsWithoutTheScript) {
    FontOptions options;
    options.candidates = {font_path_};
    options.script_sample = kUnmapped;

    EXPECT_THROW(FontResolver::resolve(options), FontResolutionError);
}

TEST(FontResolverTest, NoCandidateIsAnError) {
    FontOptions options;
    options.candidates = {"/nonexistent/a.ttf", "/nonexistent/b.ttf"};

    EXPECT_THROW(FontResolver::resolve(options), FontResolutionError);
}

TEST(FontResolverTest, UnreadableFontIsAnError) {
    EXPECT_THROW(FreeTypeFontProvider font("/nonexistent/font.ttf", 28), FontResolutionError);
}
