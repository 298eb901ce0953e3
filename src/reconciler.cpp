#include "tirgum/reconciler.h"
#include "tirgum/errors.h"
#include "tirgum/subtitle_export.h"
#include <iostream>

namespace tirgum {

namespace {

bool is_sentence_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        std::string trimmed = trim(part);
        if (trimmed.empty()) continue;
        if (!result.empty()) result += " ";
        result += trimmed;
    }
    return result;
}

} // namespace

const char* to_string(ReconcileMode mode) {
    switch (mode) {
        case ReconcileMode::Exact: return "exact";
        case ReconcileMode::SentenceChunks: return "sentence_chunks";
        case ReconcileMode::WholeText: return "whole_text";
    }
    return "unknown";
}

void validate_segments(const std::vector<Segment>& segments) {
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (seg.start < 0.0 || !(seg.end > seg.start)) {
            throw InvalidSegmentError("Segment " + std::to_string(i) + " has invalid timing [" +
                                      format_time(seg.start) + " --> " + format_time(seg.end) + "]");
        }
    }
}

Reconciler::Reconciler(const ReconcileOptions& options)
    : options_(options)
{}

ReconcileResult Reconciler::reconcile(const std::vector<Segment>& original,
                                      const TranslationUnit& translation) const {
    if (original.empty()) {
        std::string text;
        if (const auto* full = std::get_if<FullText>(&translation)) {
            text = full->text;
        } else {
            text = join(std::get<SegmentedText>(translation).texts);
        }

        std::cerr << "[Tirgum] No segment timing available, using one segment for the whole "
                  << "translation (0 --> " << format_time(options_.media_duration) << ")\n";

        ReconcileResult result;
        result.mode = ReconcileMode::WholeText;
        result.segments.push_back(whole_text_segment(text, options_.media_duration));
        return result;
    }

    if (const auto* segmented = std::get_if<SegmentedText>(&translation)) {
        if (segmented->texts.size() != original.size()) {
            throw CountMismatchError(original.size(), segmented->texts.size());
        }

        ReconcileResult result;
        result.mode = ReconcileMode::Exact;
        result.segments = original;
        for (size_t i = 0; i < original.size(); ++i) {
            result.segments[i].text = segmented->texts[i];
        }
        return result;
    }

    return map_chunks(original, std::get<FullText>(translation).text);
}

ReconcileResult Reconciler::map_chunks(const std::vector<Segment>& original,
                                       const std::string& text) const {
    std::vector<std::string> chunks = split_sentences(text);
    if (chunks.empty()) {
        throw EmptyTranscriptError("Translation contains no text");
    }

    std::cerr << "[Tirgum] Degraded mode: mapping " << chunks.size()
              << " sentence chunk(s) onto " << original.size()
              << " segment(s); timing correspondence is approximate\n";

    ReconcileResult result;
    result.mode = ReconcileMode::SentenceChunks;
    result.segments = original;

    size_t next = 0;
    for (auto& seg : result.segments) {
        if (next < chunks.size()) {
            seg.text = chunks[next++];
        } else {
            seg.text = chunks.back();
            ++result.repeated_segments;
        }
    }

    // More chunks than segments: keep the remainder on the last segment
    if (next < chunks.size()) {
        auto& last = result.segments.back();
        for (; next < chunks.size(); ++next) {
            last.text += " " + chunks[next];
            ++result.merged_chunks;
        }
        std::cerr << "[Tirgum] Appended " << result.merged_chunks
                  << " surplus chunk(s) to the last segment\n";
    }

    if (result.repeated_segments > 0) {
        std::cerr << "[Tirgum] Repeated the last chunk for " << result.repeated_segments
                  << " segment(s)\n";
    }

    return result;
}

Segment Reconciler::whole_text_segment(const std::string& text, double duration) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw EmptyTranscriptError("Translation contains no text");
    }
    if (!(duration > 0.0)) {
        throw ReconciliationError("No segment timing and no media duration to span");
    }
    return Segment(0.0, duration, trimmed, 0);
}

std::vector<std::string> Reconciler::split_sentences(const std::string& text) {
    std::vector<std::string> chunks;
    std::string current;

    auto flush = [&]() {
        std::string chunk = trim(current);
        if (!chunk.empty()) {
            chunks.push_back(std::move(chunk));
        }
        current.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        current += c;

        if (is_sentence_terminal(c)) {
            // Keep "...", "?!" etc. together with the sentence they end
            if (i + 1 < text.size() && is_sentence_terminal(text[i + 1])) {
                continue;
            }
            flush();
        }
    }
    flush();

    return chunks;
}

} // namespace tirgum
