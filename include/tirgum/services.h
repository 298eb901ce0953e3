#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace tirgum {

/**
 * @brief Speech-to-text collaborator
 *
 * Produces the time-coded segments the rest of the pipeline treats as
 * ground truth for timing. Implementations report failures as ServiceError.
 */
class TIRGUM_API TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribe the audio track of a media file
     *
     * @param media_path Path to the video or audio file
     * @return Segments (possibly empty), full text and media duration
     * @throws ServiceError if the service is unavailable or the response is malformed
     */
    virtual TranscribeResult transcribe(const std::string& media_path) = 0;
};

/**
 * @brief Machine translation collaborator
 *
 * Language codes are short ISO 639-1 codes ("en", "he", ...).
 */
class TIRGUM_API TranslationService {
public:
    virtual ~TranslationService() = default;

    /**
     * @brief Translate one block of text
     *
     * @throws ServiceError on failure
     */
    virtual std::string translate(const std::string& text,
                                  const std::string& source_lang,
                                  const std::string& target_lang) = 0;

    /**
     * @brief Translate several texts, returning one entry per input
     *
     * A well-behaved service returns exactly texts.size() entries; callers
     * must not rely on it and reconcile the counts themselves.
     *
     * @throws ServiceError on failure
     */
    virtual std::vector<std::string> translate_batch(const std::vector<std::string>& texts,
                                                     const std::string& source_lang,
                                                     const std::string& target_lang) {
        std::vector<std::string> results;
        results.reserve(texts.size());
        for (const auto& text : texts) {
            results.push_back(translate(text, source_lang, target_lang));
        }
        return results;
    }
};

} // namespace tirgum
