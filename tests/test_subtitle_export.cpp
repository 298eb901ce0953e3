#include <gtest/gtest.h>

#include <tirgum/errors.h>
#include <tirgum/subtitle_export.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tirgum;

TEST(FormatTimeTest, TruncatesToMilliseconds) {
    EXPECT_EQ(format_time(3725.4), "01:02:05,400");
    EXPECT_EQ(format_time(0.0), "00:00:00,000");
    EXPECT_EQ(format_time(1.9999), "00:00:01,999");
    EXPECT_EQ(format_time(59.001), "00:00:59,001");
    EXPECT_EQ(format_time(300.0), "00:05:00,000");
}

TEST(FormatTimeTest, NegativeClampsToZero) {
    EXPECT_EQ(format_time(-4.2), "00:00:00,000");
}

TEST(FormatTimeTest, HoursWidenPastTwoDigits) {
    EXPECT_EQ(format_time(360000.0), "100:00:00,000");
}

TEST(FormatTimeTest, VttUsesADot) {
    EXPECT_EQ(SubtitleExporter::format_vtt_timestamp(3725.4), "01:02:05.400");
    EXPECT_EQ(SubtitleExporter::format_srt_timestamp(3725.4), "01:02:05,400");
}

TEST(SubtitleExportTest, SrtDocumentIsByteExact) {
    std::vector<Segment> segments = {
        Segment(0.0, 2.0, "שלום", 0),
        Segment(2.0, 4.5, "להתראות", 1),
    };

    const std::string srt = SubtitleExporter::format_srt(SubtitleExporter::segments_to_entries(segments));

    EXPECT_EQ(srt,
              "1\n00:00:00,000 --> 00:00:02,000\nשלום\n\n"
              "2\n00:00:02,000 --> 00:00:04,500\nלהתראות\n\n");
}

TEST(SubtitleExportTest, VttDocumentHasHeader) {
    std::vector<Segment> segments = {Segment(1.25, 2.0, "שלום", 0)};

    const std::string vtt = SubtitleExporter::format_vtt(SubtitleExporter::segments_to_entries(segments));

    EXPECT_EQ(vtt, "WEBVTT\n\n1\n00:00:01.250 --> 00:00:02.000\nשלום\n\n");
}

TEST(SubtitleExportTest, BlocksUseSegmentTextOrWrappedLines) {
    SubtitleBlock block;
    block.segment = Segment(0.0, 1.0, "אחת שתיים שלוש", 0);
    Line first;
    first.logical_text = "אחת שתיים";
    first.text = "םיתש תחא";
    Line second;
    second.logical_text = "שלוש";
    second.text = "שולש";
    block.lines = {first, second};

    SubtitleExportOptions options;
    auto entries = SubtitleExporter::blocks_to_entries({block}, options);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].index, 1);
    EXPECT_EQ(entries[0].text, "אחת שתיים שלוש");

    options.use_wrapped_lines = true;
    entries = SubtitleExporter::blocks_to_entries({block}, options);
    EXPECT_EQ(entries[0].text, "אחת שתיים\nשלוש");
}

TEST(SubtitleExportTest, ParseSrtHandlesBomAndCrlf) {
    const std::string content =
        "\xEF\xBB\xBF" "1\r\n"
        "00:00:00,000 --> 00:00:02,500\r\n"
        "Hello\r\n"
        "there\r\n"
        "\r\n"
        "2\r\n"
        "00:00:03.1 --> 01:02:05,400\r\n"
        "Bye\r\n";

    auto segments = SubtitleExporter::parse_srt(content);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].id, 0);
    EXPECT_DOUBLE_EQ(segments[0].start, 0.0);
    EXPECT_DOUBLE_EQ(segments[0].end, 2.5);
    EXPECT_EQ(segments[0].text, "Hello\nthere");
    EXPECT_EQ(segments[1].id, 1);
    EXPECT_NEAR(segments[1].start, 3.1, 1e-9);
    EXPECT_NEAR(segments[1].end, 3725.4, 1e-9);
    EXPECT_EQ(segments[1].text, "Bye");
}

TEST(SubtitleExportTest, ParseSrtRejectsMalformedTiming) {
    EXPECT_THROW(SubtitleExporter::parse_srt("1\n00:00:01,000 00:00:02,000\ntext\n"), InvalidSegmentError);
    EXPECT_THROW(SubtitleExporter::parse_srt_timestamp("00:61:00,000"), InvalidSegmentError);
    EXPECT_THROW(SubtitleExporter::parse_srt_timestamp("garbage"), InvalidSegmentError);
}

TEST(SubtitleExportTest, FormattedSrtParsesBackToTheSameTimeline) {
    std::vector<Segment> segments = {
        Segment(0.0, 1.5, "אחת", 0),
        Segment(1.5, 3725.4, "שתיים", 1),
    };

    auto parsed = SubtitleExporter::parse_srt(
        SubtitleExporter::format_srt(SubtitleExporter::segments_to_entries(segments)));

    ASSERT_EQ(parsed.size(), segments.size());
    for (size_t i = 0; i < parsed.size(); ++i) {
        EXPECT_EQ(format_time(parsed[i].start), format_time(segments[i].start));
        EXPECT_EQ(format_time(parsed[i].end), format_time(segments[i].end));
        EXPECT_EQ(parsed[i].text, segments[i].text);
    }
}

TEST(SubtitleExportTest, ExportWritesBesideTheVideo) {
    const auto dir = std::filesystem::temp_directory_path() / "tirgum_export_test";
    std::filesystem::create_directories(dir);
    const std::string video = (dir / "clip.mp4").string();

    SubtitleBlock block;
    block.segment = Segment(0.0, 2.0, "שלום", 0);

    SubtitleExporter exporter;
    const std::string path = exporter.export_srt({block}, video);

    EXPECT_EQ(path, (dir / "clip.srt").string());
    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    EXPECT_EQ(ss.str(), "1\n00:00:00,000 --> 00:00:02,000\nשלום\n\n");

    std::filesystem::remove_all(dir);
}

TEST(SubtitleExportTest, ExportSubtitlesHonoursFormatAndExplicitPath) {
    const auto dir = std::filesystem::temp_directory_path() / "tirgum_export_vtt_test";
    std::filesystem::create_directories(dir);

    SubtitleBlock block;
    block.segment = Segment(1.5, 3.0, "שלום עולם", 0);
    Line first;
    first.logical_text = "שלום";
    Line second;
    second.logical_text = "עולם";
    block.lines = {first, second};

    SubtitleExportOptions options;
    options.format = SubtitleFormat::VTT;
    options.use_wrapped_lines = true;
    options.output_path = (dir / "cues.vtt").string();

    SubtitleExporter exporter;
    const std::string path = exporter.export_subtitles({block}, (dir / "clip.mp4").string(), options);

    EXPECT_EQ(path, options.output_path);
    EXPECT_FALSE(std::filesystem::exists(dir / "clip.vtt"));

    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    EXPECT_EQ(ss.str(), SubtitleExporter::format_vtt(SubtitleExporter::blocks_to_entries({block}, options)));
    EXPECT_EQ(ss.str().rfind("WEBVTT", 0), 0u);
    EXPECT_NE(ss.str().find("00:00:01.500 --> 00:00:03.000\nשלום\nעולם\n"), std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(SubtitleExportTest, ExportFailsForUnwritablePath) {
    SubtitleBlock block;
    block.segment = Segment(0.0, 1.0, "שלום", 0);

    SubtitleExportOptions options;
    options.output_path = (std::filesystem::temp_directory_path() /
                           "tirgum_missing_dir" / "nested" / "out.srt").string();

    SubtitleExporter exporter;
    EXPECT_THROW(exporter.export_subtitles({block}, "clip.mp4", options), Error);
}

TEST(SubtitleMetadataTest, JsonCarriesBothTimelines) {
    JobMetadata metadata;
    metadata.video_file = "clip \"1\".mp4";
    metadata.source_language = "en";
    metadata.target_language = "he";
    metadata.reconcile_mode = "exact";
    metadata.duration = 4.0;
    metadata.original = {Segment(0.0, 2.0, "Hi", 0)};
    metadata.translated = {Segment(0.0, 2.0, "שלום", 0)};

    const std::string json = SubtitleMetadata::to_json(metadata);

    EXPECT_NE(json.find("\"video_file\": \"clip \\\"1\\\".mp4\""), std::string::npos);
    EXPECT_NE(json.find("\"reconcile_mode\": \"exact\""), std::string::npos);
    EXPECT_NE(json.find("\"text\": \"Hi\""), std::string::npos);
    EXPECT_NE(json.find("\"text\": \"שלום\""), std::string::npos);
    EXPECT_NE(json.find("\"duration\": 4.000"), std::string::npos);
}
