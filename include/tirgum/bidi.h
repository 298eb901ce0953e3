#pragma once

#include "export.h"
#include <string>

namespace tirgum {

/**
 * @brief Base (paragraph) direction for bidi reordering
 */
enum class TextDirection {
    Auto,           // from the first strong character, left-to-right if none
    LeftToRight,
    RightToLeft
};

/**
 * @brief Base direction of a whole paragraph
 *
 * Taken from the first strong character. Text with no strong character
 * (digits, punctuation, blank) is left-to-right.
 */
TIRGUM_API TextDirection paragraph_direction(const std::string& logical_text);

/**
 * @brief Reorder a logical-order UTF-8 string into visual (draw) order
 *
 * Applies the Unicode Bidirectional Algorithm (ICU). With TextDirection::Auto
 * the base direction is taken from the string's own first strong character.
 * A line cut from a longer paragraph must be reordered with the paragraph's
 * direction instead, otherwise a right-to-left line that starts with a Latin
 * word is laid out left-to-right. Right-to-left
 * runs are reversed as a whole, mirrored characters such as brackets are
 * swapped and bidi control characters are removed. With shape_arabic set,
 * Arabic letters are first replaced with their contextual presentation
 * forms so the visual string draws correctly with a plain glyph lookup.
 *
 * @throws Error if ICU rejects the input
 */
TIRGUM_API std::string to_visual_order(const std::string& logical_text,
                                       bool shape_arabic = true,
                                       TextDirection direction = TextDirection::Auto);

/**
 * @brief True if the text contains any right-to-left character
 */
TIRGUM_API bool contains_rtl(const std::string& text);

} // namespace tirgum
