#include <gtest/gtest.h>

#include <tirgum/errors.h>
#include <tirgum/reconciler.h>

using namespace tirgum;

namespace {

std::vector<Segment> three_segments() {
    return {
        Segment(0.0, 1.5, "Hello world.", 0),
        Segment(1.5, 3.0, "How are you?", 1),
        Segment(3.2, 4.0, "Fine!", 2),
    };
}

void expect_same_timing(const std::vector<Segment>& a, const std::vector<Segment>& b) {
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a[i].start, b[i].start) << "segment " << i;
        EXPECT_DOUBLE_EQ(a[i].end, b[i].end) << "segment " << i;
        EXPECT_EQ(a[i].id, b[i].id) << "segment " << i;
    }
}

} // namespace

TEST(ReconcilerTest, SegmentedTranslationMapsElementWise) {
    const auto original = three_segments();
    SegmentedText translated{{"שלום עולם.", "מה שלומך?", "בסדר!"}};

    ReconcileResult result = Reconciler().reconcile(original, translated);

    EXPECT_EQ(result.mode, ReconcileMode::Exact);
    expect_same_timing(original, result.segments);
    EXPECT_EQ(result.segments[0].text, "שלום עולם.");
    EXPECT_EQ(result.segments[1].text, "מה שלומך?");
    EXPECT_EQ(result.segments[2].text, "בסדר!");
    EXPECT_EQ(result.repeated_segments, 0u);
}

TEST(ReconcilerTest, SegmentedTranslationWithWrongLengthThrows) {
    const auto original = three_segments();

    try {
        Reconciler().reconcile(original, SegmentedText{{"אחד", "שתיים"}});
        FAIL() << "expected CountMismatchError";
    } catch (const CountMismatchError& e) {
        EXPECT_EQ(e.expected(), 3u);
        EXPECT_EQ(e.got(), 2u);
    }

    EXPECT_THROW(Reconciler().reconcile(original, SegmentedText{{"1", "2", "3", "4"}}),
                 CountMismatchError);
}

TEST(ReconcilerTest, CountMismatchIsAReconciliationError) {
    EXPECT_THROW(Reconciler().reconcile(three_segments(), SegmentedText{{"x"}}),
                 ReconciliationError);
}

TEST(ReconcilerTest, FullTextSplitsIntoSentenceChunks) {
    const auto original = three_segments();

    ReconcileResult result = Reconciler().reconcile(original, FullText{"Hello world. How are you? Fine!"});

    EXPECT_EQ(result.mode, ReconcileMode::SentenceChunks);
    expect_same_timing(original, result.segments);
    EXPECT_EQ(result.segments[0].text, "Hello world.");
    EXPECT_EQ(result.segments[1].text, "How are you?");
    EXPECT_EQ(result.segments[2].text, "Fine!");
    EXPECT_EQ(result.repeated_segments, 0u);
    EXPECT_EQ(result.merged_chunks, 0u);
}

TEST(ReconcilerTest, FewerChunksThanSegmentsRepeatsTheLastChunk) {
    const auto original = three_segments();

    ReconcileResult result = Reconciler().reconcile(original, FullText{"אחד. שתיים."});

    ASSERT_EQ(result.segments.size(), 3u);
    EXPECT_EQ(result.segments[0].text, "אחד.");
    EXPECT_EQ(result.segments[1].text, "שתיים.");
    EXPECT_EQ(result.segments[2].text, "שתיים.");
    EXPECT_EQ(result.repeated_segments, 1u);
}

TEST(ReconcilerTest, SurplusChunksAreAppendedToTheLastSegment) {
    std::vector<Segment> original = {Segment(0.0, 1.0, "a", 0), Segment(1.0, 2.0, "b", 1)};

    ReconcileResult result = Reconciler().reconcile(original, FullText{"A. B. C!"});

    ASSERT_EQ(result.segments.size(), 2u);
    EXPECT_EQ(result.segments[0].text, "A.");
    EXPECT_EQ(result.segments[1].text, "B. C!");
    EXPECT_EQ(result.merged_chunks, 1u);
}

TEST(ReconcilerTest, BlankFullTextThrows) {
    EXPECT_THROW(Reconciler().reconcile(three_segments(), FullText{"  \n "}), EmptyTranscriptError);
}

TEST(ReconcilerTest, NoSegmentsCollapseToOneSpanningSegment) {
    ReconcileOptions options;
    options.media_duration = 42.5;

    ReconcileResult result = Reconciler(options).reconcile({}, FullText{"  כל הטקסט המתורגם.  "});

    EXPECT_EQ(result.mode, ReconcileMode::WholeText);
    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_DOUBLE_EQ(result.segments[0].start, 0.0);
    EXPECT_DOUBLE_EQ(result.segments[0].end, 42.5);
    EXPECT_EQ(result.segments[0].text, "כל הטקסט המתורגם.");
}

TEST(ReconcilerTest, NoSegmentsJoinSegmentedTextWithSpaces) {
    ReconcileOptions options;
    options.media_duration = 3.0;

    ReconcileResult result = Reconciler(options).reconcile({}, SegmentedText{{"שלום", "", "עולם"}});

    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_EQ(result.segments[0].text, "שלום עולם");
}

TEST(ReconcilerTest, NoSegmentsAndNoDurationThrows) {
    EXPECT_THROW(Reconciler().reconcile({}, FullText{"text"}), ReconciliationError);
}

TEST(ReconcilerTest, SplitSentencesKeepsTerminalRunsTogether) {
    auto chunks = Reconciler::split_sentences("Wait... What?! trailing words");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], "Wait...");
    EXPECT_EQ(chunks[1], "What?!");
    EXPECT_EQ(chunks[2], "trailing words");
}

TEST(ReconcilerTest, SplitSentencesDropsEmptyChunks) {
    auto chunks = Reconciler::split_sentences("  . One.  ");

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], ".");
    EXPECT_EQ(chunks[1], "One.");
    EXPECT_TRUE(Reconciler::split_sentences("   ").empty());
}

TEST(ReconcilerTest, ModeNames) {
    EXPECT_STREQ(to_string(ReconcileMode::Exact), "exact");
    EXPECT_STREQ(to_string(ReconcileMode::SentenceChunks), "sentence_chunks");
    EXPECT_STREQ(to_string(ReconcileMode::WholeText), "whole_text");
}

TEST(SegmentValidationTest, RejectsInvalidTiming) {
    EXPECT_NO_THROW(validate_segments(three_segments()));
    EXPECT_THROW(validate_segments({Segment(2.0, 2.0, "zero length")}), InvalidSegmentError);
    EXPECT_THROW(validate_segments({Segment(3.0, 1.0, "backwards")}), InvalidSegmentError);
    EXPECT_THROW(validate_segments({Segment(-0.5, 1.0, "negative")}), InvalidSegmentError);
}

TEST(SegmentValidationTest, OverlappingSegmentsAreAllowed) {
    EXPECT_NO_THROW(validate_segments({Segment(0.0, 2.0, "a"), Segment(1.0, 3.0, "b")}));
}
