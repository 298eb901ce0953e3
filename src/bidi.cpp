#include "tirgum/bidi.h"
#include "tirgum/errors.h"
#include <memory>
#include <vector>

#include <unicode/ubidi.h>
#include <unicode/uchar.h>
#include <unicode/ushape.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>

namespace tirgum {

namespace {

struct BidiCloser {
    void operator()(UBiDi* bidi) const { ubidi_close(bidi); }
};
using BidiPtr = std::unique_ptr<UBiDi, BidiCloser>;

void check(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        throw Error(std::string("ICU ") + what + " failed: " + u_errorName(status));
    }
}

std::u16string utf8_to_utf16(const std::string& text) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;

    // Preflight for the required length
    u_strFromUTF8WithSub(nullptr, 0, &length, text.data(), static_cast<int32_t>(text.size()),
                         0xFFFD, nullptr, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR) {
        check(status, "u_strFromUTF8 preflight");
    }

    std::u16string result(static_cast<size_t>(length), u'\0');
    status = U_ZERO_ERROR;
    u_strFromUTF8WithSub(reinterpret_cast<UChar*>(&result[0]), length, nullptr,
                         text.data(), static_cast<int32_t>(text.size()),
                         0xFFFD, nullptr, &status);
    check(status, "u_strFromUTF8");
    return result;
}

std::string utf16_to_utf8(const std::u16string& text) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t length = 0;

    u_strToUTF8(nullptr, 0, &length, reinterpret_cast<const UChar*>(text.data()),
                static_cast<int32_t>(text.size()), &status);
    if (status != U_BUFFER_OVERFLOW_ERROR) {
        check(status, "u_strToUTF8 preflight");
    }

    std::string result(static_cast<size_t>(length), '\0');
    status = U_ZERO_ERROR;
    u_strToUTF8(&result[0], length, nullptr, reinterpret_cast<const UChar*>(text.data()),
                static_cast<int32_t>(text.size()), &status);
    check(status, "u_strToUTF8");
    return result;
}

std::u16string shape_arabic_letters(const std::u16string& text) {
    const uint32_t options = U_SHAPE_LETTERS_SHAPE | U_SHAPE_TEXT_DIRECTION_LOGICAL;
    UErrorCode status = U_ZERO_ERROR;

    int32_t length = u_shapeArabic(reinterpret_cast<const UChar*>(text.data()),
                                   static_cast<int32_t>(text.size()),
                                   nullptr, 0, options, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR) {
        check(status, "u_shapeArabic preflight");
    }

    std::u16string shaped(static_cast<size_t>(length), u'\0');
    status = U_ZERO_ERROR;
    u_shapeArabic(reinterpret_cast<const UChar*>(text.data()), static_cast<int32_t>(text.size()),
                  reinterpret_cast<UChar*>(&shaped[0]), length, options, &status);
    check(status, "u_shapeArabic");
    return shaped;
}

UBiDiLevel paragraph_level(TextDirection direction) {
    switch (direction) {
        case TextDirection::LeftToRight: return UBIDI_LTR;
        case TextDirection::RightToLeft: return UBIDI_RTL;
        case TextDirection::Auto: break;
    }
    return UBIDI_DEFAULT_LTR;
}

} // namespace

TextDirection paragraph_direction(const std::string& logical_text) {
    if (logical_text.empty()) {
        return TextDirection::LeftToRight;
    }

    const std::u16string text = utf8_to_utf16(logical_text);
    const UBiDiDirection dir = ubidi_getBaseDirection(reinterpret_cast<const UChar*>(text.data()),
                                                      static_cast<int32_t>(text.size()));
    return dir == UBIDI_RTL ? TextDirection::RightToLeft : TextDirection::LeftToRight;
}

std::string to_visual_order(const std::string& logical_text, bool shape_arabic,
                            TextDirection direction) {
    if (logical_text.empty()) {
        return logical_text;
    }

    std::u16string logical = utf8_to_utf16(logical_text);
    if (shape_arabic) {
        logical = shape_arabic_letters(logical);
    }

    UErrorCode status = U_ZERO_ERROR;
    BidiPtr bidi(ubidi_openSized(static_cast<int32_t>(logical.size()), 0, &status));
    check(status, "ubidi_openSized");

    ubidi_setPara(bidi.get(), reinterpret_cast<const UChar*>(logical.data()),
                  static_cast<int32_t>(logical.size()), paragraph_level(direction), nullptr, &status);
    check(status, "ubidi_setPara");

    const uint16_t options = UBIDI_DO_MIRRORING | UBIDI_REMOVE_BIDI_CONTROLS;

    // Removing controls can only shrink the output
    std::u16string visual(logical.size(), u'\0');
    const int32_t length = ubidi_writeReordered(bidi.get(), reinterpret_cast<UChar*>(&visual[0]),
                                                static_cast<int32_t>(visual.size()), options, &status);
    check(status, "ubidi_writeReordered");
    visual.resize(static_cast<size_t>(length));

    return utf16_to_utf8(visual);
}

bool contains_rtl(const std::string& text) {
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;

    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) continue;

        const UCharDirection dir = u_charDirection(c);
        if (dir == U_RIGHT_TO_LEFT || dir == U_RIGHT_TO_LEFT_ARABIC) {
            return true;
        }
    }
    return false;
}

} // namespace tirgum
