#include "tirgum/translator.h"
#include "tirgum/errors.h"
#include <ctranslate2/translator.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <unordered_map>

#ifdef TIRGUM_USE_SENTENCEPIECE
#include <sentencepiece_processor.h>
#endif

namespace tirgum {

// ═══════════════════════════════════════════════════════════════════════════
// Language Mappings
// ═══════════════════════════════════════════════════════════════════════════

// Short code -> NLLB code
static const std::unordered_map<std::string, std::string> CODE_TO_NLLB = {
    {"en", "eng_Latn"},      // English
    {"es", "spa_Latn"},      // Spanish
    {"fr", "fra_Latn"},      // French
    {"de", "deu_Latn"},      // German
    {"it", "ita_Latn"},      // Italian
    {"pt", "por_Latn"},      // Portuguese
    {"ru", "rus_Cyrl"},      // Russian
    {"uk", "ukr_Cyrl"},      // Ukrainian
    {"tr", "tur_Latn"},      // Turkish
    {"zh", "zho_Hans"},      // Chinese (Simplified)
    {"ja", "jpn_Jpan"},      // Japanese

    // Right-to-left targets
    {"he", "heb_Hebr"},      // Hebrew
    {"yi", "ydd_Hebr"},      // Yiddish
    {"ar", "arb_Arab"},      // Arabic
    {"fa", "pes_Arab"},      // Persian (Farsi)
    {"ur", "urd_Arab"},      // Urdu
};

static const char* EOS_TOKEN = "</s>";

// ═══════════════════════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════════════════════

class NllbTranslator::Impl {
public:
    std::unique_ptr<ctranslate2::Translator> model;
    NllbOptions options;

#ifdef TIRGUM_USE_SENTENCEPIECE
    sentencepiece::SentencePieceProcessor sp_processor;
    bool sp_loaded = false;
#endif

    Impl(const std::string& model_path, const NllbOptions& opts)
        : options(opts)
    {
        try {
            ctranslate2::Device device = (opts.device == "cuda" || opts.device == "CUDA")
                ? ctranslate2::Device::CUDA
                : ctranslate2::Device::CPU;

            model = std::make_unique<ctranslate2::Translator>(
                model_path,
                device,
                ctranslate2::str_to_compute_type(opts.compute_type),
                std::vector<int>{opts.device_index}
            );
        } catch (const std::exception& e) {
            throw ServiceError("translation", "failed to load model " + model_path + ": " + e.what());
        }

        std::cout << "[Tirgum] Translator loaded: " << model_path
                  << " (device=" << opts.device << ", compute=" << opts.compute_type << ")\n";

#ifdef TIRGUM_USE_SENTENCEPIECE
        std::filesystem::path sp_model_path = std::filesystem::path(model_path) / "sentencepiece.bpe.model";
        if (std::filesystem::exists(sp_model_path)) {
            auto status = sp_processor.Load(sp_model_path.string());
            if (status.ok()) {
                sp_loaded = true;
                std::cout << "[Tirgum] SentencePiece tokenizer loaded: " << sp_model_path.string() << "\n";
            } else {
                std::cerr << "[Tirgum] SentencePiece load failed: " << status.ToString() << "\n";
            }
        } else {
            std::cerr << "[Tirgum] SentencePiece model not found: " << sp_model_path.string() << "\n";
        }
#endif
    }

    std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> tokens;

#ifdef TIRGUM_USE_SENTENCEPIECE
        if (sp_loaded) {
            auto status = sp_processor.Encode(text, &tokens);
            if (!status.ok()) {
                throw ServiceError("translation", "SentencePiece encode failed: " + status.ToString());
            }
            return tokens;
        }
#endif

        std::istringstream iss(text);
        std::string word;
        while (iss >> word) {
            tokens.push_back(word);
        }
        return tokens;
    }

    std::string detokenize(const std::vector<std::string>& tokens) {
#ifdef TIRGUM_USE_SENTENCEPIECE
        if (sp_loaded) {
            std::string result;
            auto status = sp_processor.Decode(tokens, &result);
            if (!status.ok()) {
                throw ServiceError("translation", "SentencePiece decode failed: " + status.ToString());
            }
            return result;
        }
#endif

        std::string result;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i > 0) result += " ";
            result += tokens[i];
        }
        return result;
    }

    std::pair<std::string, std::string> language_pair(const std::string& source_lang,
                                                      const std::string& target_lang) const {
        std::string src = to_nllb_code(source_lang);
        std::string tgt = to_nllb_code(target_lang);
        if (src.empty() || tgt.empty()) {
            throw ServiceError("translation", "unsupported language pair " +
                               source_lang + " -> " + target_lang);
        }
        return {src, tgt};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

NllbTranslator::NllbTranslator(const std::string& model_path, const NllbOptions& options)
    : pimpl_(std::make_unique<Impl>(model_path, options))
{}

NllbTranslator::~NllbTranslator() = default;

NllbTranslator::NllbTranslator(NllbTranslator&&) noexcept = default;
NllbTranslator& NllbTranslator::operator=(NllbTranslator&&) noexcept = default;

std::string NllbTranslator::translate(const std::string& text,
                                      const std::string& source_lang,
                                      const std::string& target_lang) {
    return translate_batch({text}, source_lang, target_lang).front();
}

std::vector<std::string> NllbTranslator::translate_batch(const std::vector<std::string>& texts,
                                                         const std::string& source_lang,
                                                         const std::string& target_lang) {
    if (texts.empty()) {
        return {};
    }

    const auto codes = pimpl_->language_pair(source_lang, target_lang);
    const std::string& src_nllb = codes.first;
    const std::string& tgt_nllb = codes.second;

    if (src_nllb == tgt_nllb) {
        return texts;
    }

    const NllbOptions& opts = pimpl_->options;
    ctranslate2::TranslationOptions ct_options;
    ct_options.beam_size = opts.beam_size;
    ct_options.length_penalty = opts.length_penalty;
    ct_options.repetition_penalty = opts.repetition_penalty;
    ct_options.no_repeat_ngram_size = opts.no_repeat_ngram_size;
    ct_options.max_decoding_length = opts.max_length;

    const size_t batch_size = std::max<size_t>(opts.batch_size, 1);
    std::vector<std::string> translations;
    translations.reserve(texts.size());

    for (size_t batch_start = 0; batch_start < texts.size(); batch_start += batch_size) {
        const size_t batch_end = std::min(batch_start + batch_size, texts.size());

        // NLLB source: [src_lang, tokens..., </s>]; decoder prefix: [</s>, tgt_lang]
        std::vector<std::vector<std::string>> inputs;
        std::vector<std::vector<std::string>> prefixes;
        for (size_t i = batch_start; i < batch_end; ++i) {
            std::vector<std::string> tokens;
            tokens.push_back(src_nllb);
            auto text_tokens = pimpl_->tokenize(texts[i]);
            tokens.insert(tokens.end(), text_tokens.begin(), text_tokens.end());
            tokens.push_back(EOS_TOKEN);
            inputs.push_back(std::move(tokens));
            prefixes.push_back({EOS_TOKEN, tgt_nllb});
        }

        std::vector<ctranslate2::TranslationResult> results;
        try {
            results = pimpl_->model->translate_batch(inputs, prefixes, ct_options);
        } catch (const std::exception& e) {
            throw ServiceError("translation", "batch " + std::to_string(batch_start / batch_size) +
                               " failed: " + e.what());
        }

        if (results.size() != inputs.size()) {
            throw ServiceError("translation", "model returned " + std::to_string(results.size()) +
                               " results for " + std::to_string(inputs.size()) + " inputs");
        }

        for (size_t i = 0; i < results.size(); ++i) {
            if (results[i].hypotheses.empty()) {
                throw ServiceError("translation", "no hypothesis for text " +
                                   std::to_string(batch_start + i));
            }
            translations.push_back(clean_output(pimpl_->detokenize(results[i].hypotheses[0]), tgt_nllb));
        }
    }

    return translations;
}

bool NllbTranslator::supports_language_pair(const std::string& source,
                                            const std::string& target) const {
    return !to_nllb_code(source).empty() && !to_nllb_code(target).empty();
}

std::string NllbTranslator::to_nllb_code(const std::string& code) {
    auto it = CODE_TO_NLLB.find(code);
    return (it != CODE_TO_NLLB.end()) ? it->second : "";
}

// Simple string operations instead of std::regex (std::regex is very slow here)
std::string NllbTranslator::clean_output(const std::string& text, const std::string& target_nllb) {
    std::string result = text;

    if (!target_nllb.empty() && result.compare(0, target_nllb.size(), target_nllb) == 0) {
        result = result.substr(target_nllb.size());
    }

    auto start = result.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    auto end = result.find_last_not_of(" \t\n\r");
    result = result.substr(start, end - start + 1);

    auto is_punct = [](char c) {
        return c == '.' || c == ',' || c == '!' || c == '?' || c == ';' || c == ':';
    };

    std::string cleaned;
    cleaned.reserve(result.size());
    for (size_t i = 0; i < result.size(); ++i) {
        char c = result[i];

        // " ." -> "."
        if (c == ' ' && i + 1 < result.size() && is_punct(result[i + 1])) {
            continue;
        }

        cleaned += c;

        // ".Next" -> ". Next" (ASCII letters only; RTL scripts are left alone)
        if (is_punct(c) && i + 1 < result.size()) {
            char next = result[i + 1];
            if ((next >= 'A' && next <= 'Z') || (next >= 'a' && next <= 'z')) {
                cleaned += ' ';
            }
        }
    }

    return cleaned;
}

} // namespace tirgum
