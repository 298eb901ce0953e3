#pragma once

#include "tirgum/types.h"
#include <cstdint>
#include <string>
#include <vector>
#include <unicode/utf8.h>

namespace tirgum {
namespace raster {

/**
 * @brief Blend a colour into an RGBA pixel with the given coverage ("over")
 */
inline void blend_pixel(uint8_t* dst, const Color& color, uint8_t coverage) {
    const float src_a = (coverage / 255.0f) * (color.a / 255.0f);
    if (src_a <= 0.0f) {
        return;
    }
    const float dst_a = dst[3] / 255.0f;
    const float out_a = src_a + dst_a * (1.0f - src_a);

    const uint8_t src[3] = {color.r, color.g, color.b};
    for (int k = 0; k < 3; ++k) {
        const float value = (src[k] * src_a + dst[k] * dst_a * (1.0f - src_a)) / out_a;
        dst[k] = static_cast<uint8_t>(value + 0.5f);
    }
    dst[3] = static_cast<uint8_t>(out_a * 255.0f + 0.5f);
}

/**
 * @brief Decode UTF-8 to code points (ill-formed sequences become U+FFFD)
 */
inline std::vector<UChar32> decode_utf8(const std::string& text) {
    std::vector<UChar32> codepoints;
    codepoints.reserve(text.size());

    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        codepoints.push_back(c < 0 ? 0xFFFD : c);
    }
    return codepoints;
}

/**
 * @brief Whitespace that is advanced over rather than drawn
 */
inline bool is_blank(UChar32 c) {
    return c == ' ' || c == '\t' || c == 0xA0 || c == 0x202F || c == 0x3000;
}

/**
 * @brief Zero-width formatting characters (bidi controls, joiners, BOM)
 */
inline bool is_ignorable(UChar32 c) {
    return (c >= 0x200B && c <= 0x200F) ||
           (c >= 0x202A && c <= 0x202E) ||
           (c >= 0x2066 && c <= 0x2069) ||
           c == 0xFEFF || c == '\r' || c == '\n';
}

} // namespace raster
} // namespace tirgum
