#include <gtest/gtest.h>

#include <tirgum/bidi.h>
#include <tirgum/errors.h>
#include <tirgum/translator.h>
#include <cstdlib>

using namespace tirgum;

TEST(NllbTranslatorTest, LanguageCodes) {
    EXPECT_EQ(NllbTranslator::to_nllb_code("en"), "eng_Latn");
    EXPECT_EQ(NllbTranslator::to_nllb_code("he"), "heb_Hebr");
    EXPECT_EQ(NllbTranslator::to_nllb_code("ar"), "arb_Arab");
    EXPECT_EQ(NllbTranslator::to_nllb_code("xx"), "");
}

TEST(NllbTranslatorTest, CleanOutputStripsTheLanguageToken) {
    EXPECT_EQ(NllbTranslator::clean_output("heb_Hebr שלום עולם ", "heb_Hebr"), "שלום עולם");
    EXPECT_EQ(NllbTranslator::clean_output("   ", "heb_Hebr"), "");
}

TEST(NllbTranslatorTest, CleanOutputFixesPunctuationSpacing) {
    EXPECT_EQ(NllbTranslator::clean_output("Hello , world .Next", "eng_Latn"), "Hello, world. Next");
    EXPECT_EQ(NllbTranslator::clean_output("שלום .מה", "heb_Hebr"), "שלום.מה");
}

// Needs a CTranslate2-converted model: TIRGUM_NLLB_MODEL=models/nllb-200-distilled-600M
TEST(NllbTranslatorTest, TranslatesOneEntryPerInput) {
    const char* model = std::getenv("TIRGUM_NLLB_MODEL");
    if (model == nullptr) {
        GTEST_SKIP() << "TIRGUM_NLLB_MODEL not set";
    }

    NllbTranslator translator(model);
    auto texts = translator.translate_batch({"Hello.", "Goodbye.", "Thank you very much."}, "en", "he");

    ASSERT_EQ(texts.size(), 3u);
    for (const auto& text : texts) {
        EXPECT_FALSE(text.empty());
        EXPECT_TRUE(contains_rtl(text)) << text;
    }

    EXPECT_THROW(translator.translate("Hello", "en", "xx"), ServiceError);
}

TEST(NllbTranslatorTest, MissingModelIsAServiceError) {
    EXPECT_THROW(NllbTranslator translator("/nonexistent/nllb-model"), ServiceError);
}
