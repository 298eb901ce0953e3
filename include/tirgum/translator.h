#pragma once

#include "export.h"
#include "services.h"
#include <memory>
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Decoding options for the NLLB model
 */
struct NllbOptions {
    std::string device = "cpu";         // "cuda" or "cpu"
    std::string compute_type = "int8";  // "float16", "int8", "float32"
    int device_index = 0;
    int beam_size = 4;                  // Beam search width (1-10)
    float length_penalty = 1.0f;
    float repetition_penalty = 1.0f;
    int no_repeat_ngram_size = 0;       // 0 = disabled
    int max_length = 256;               // Maximum output tokens per text
    size_t batch_size = 8;              // Texts per model call
};

/**
 * @brief TranslationService backed by an NLLB-200 model through CTranslate2
 *
 * Short codes ("en", "he", ...) are mapped to NLLB codes ("eng_Latn",
 * "heb_Hebr", ...). Tokenization uses SentencePiece when the library is
 * available and the model directory ships sentencepiece.bpe.model, and
 * falls back to whitespace splitting otherwise.
 *
 * Thread Safety:
 * - Static methods are thread-safe
 * - Instance methods are NOT thread-safe for concurrent calls on the same instance
 *
 * Usage:
 * @code
 *   tirgum::NllbTranslator translator("models/nllb-200-distilled-600M");
 *   auto texts = translator.translate_batch({"Hi", "Bye"}, "en", "he");
 * @endcode
 */
class TIRGUM_API NllbTranslator : public TranslationService {
public:
    /**
     * @param model_path Path to a CTranslate2-converted NLLB model directory
     * @throws ServiceError if the model cannot be loaded
     */
    explicit NllbTranslator(const std::string& model_path, const NllbOptions& options = {});

    ~NllbTranslator() override;

    // Non-copyable, movable
    NllbTranslator(const NllbTranslator&) = delete;
    NllbTranslator& operator=(const NllbTranslator&) = delete;
    NllbTranslator(NllbTranslator&&) noexcept;
    NllbTranslator& operator=(NllbTranslator&&) noexcept;

    /**
     * @throws ServiceError if the language pair is unsupported or decoding fails
     */
    std::string translate(const std::string& text,
                          const std::string& source_lang,
                          const std::string& target_lang) override;

    /**
     * @brief Translate in model batches of NllbOptions::batch_size
     *
     * Returns exactly one entry per input, in input order.
     *
     * @throws ServiceError if the language pair is unsupported or decoding fails
     */
    std::vector<std::string> translate_batch(const std::vector<std::string>& texts,
                                             const std::string& source_lang,
                                             const std::string& target_lang) override;

    bool supports_language_pair(const std::string& source, const std::string& target) const;

    /**
     * @brief NLLB code for a short language code, empty if unsupported
     */
    static std::string to_nllb_code(const std::string& code);

    /**
     * @brief Remove a leading language token and fix spacing around punctuation
     */
    static std::string clean_output(const std::string& text, const std::string& target_nllb);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tirgum
