/**
 * @file translation_example.cpp
 * @brief Translate an SRT file with NLLB and keep the original timing
 *
 * This example shows how to:
 * 1. Read time-coded segments from an SRT file
 * 2. Translate every segment in one batch with NLLB (CTranslate2)
 * 3. Reconcile the translation with the original timing and write SRT
 *
 * Usage:
 *   translation_example <nllb_model> <input.srt> [target_lang] [output.srt]
 *
 * Example:
 *   translation_example models/nllb-200-distilled-600M talk.srt he talk.he.srt
 */

#include <tirgum/errors.h>
#include <tirgum/reconciler.h>
#include <tirgum/subtitle_export.h>
#include <tirgum/translator.h>
#include <chrono>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <nllb_model> <input.srt> [target_lang] [output.srt]\n\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " models/nllb-200-distilled-600M talk.srt he talk.he.srt\n";
        return 1;
    }

    const std::string model_path = argv[1];
    const std::string input_path = argv[2];
    const std::string target_lang = argc > 3 ? argv[3] : "he";
    const std::string output_path = argc > 4 ? argv[4] : "";

    try {
        std::vector<tirgum::Segment> segments = tirgum::SubtitleExporter::load_srt(input_path);
        std::cout << "Loaded " << segments.size() << " segment(s) from " << input_path << "\n";

        auto start = std::chrono::high_resolution_clock::now();
        tirgum::NllbTranslator translator(model_path);
        auto load_time = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start).count();
        std::cout << "NLLB loaded in " << std::fixed << std::setprecision(2) << load_time << "s\n";

        if (!translator.supports_language_pair("en", target_lang)) {
            std::cerr << "Error: Unsupported target language '" << target_lang << "'\n";
            return 1;
        }

        std::vector<std::string> texts;
        texts.reserve(segments.size());
        for (const auto& seg : segments) {
            texts.push_back(seg.text);
        }

        start = std::chrono::high_resolution_clock::now();
        tirgum::SegmentedText translated{translator.translate_batch(texts, "en", target_lang)};
        auto translate_time = std::chrono::duration<double>(
            std::chrono::high_resolution_clock::now() - start).count();
        std::cout << "Translated in " << std::fixed << std::setprecision(2) << translate_time << "s\n";

        tirgum::ReconcileResult result = tirgum::Reconciler().reconcile(segments, translated);

        if (output_path.empty()) {
            std::cout << "\n" << tirgum::SubtitleExporter::format_srt(
                tirgum::SubtitleExporter::segments_to_entries(result.segments));
        } else {
            // Segment text only, no layout
            std::vector<tirgum::SubtitleBlock> blocks(result.segments.size());
            for (size_t i = 0; i < result.segments.size(); ++i) {
                blocks[i].segment = result.segments[i];
            }

            tirgum::SubtitleExportOptions options;
            options.output_path = output_path;
            tirgum::SubtitleExporter().export_srt(blocks, input_path, options);
        }

    } catch (const tirgum::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
