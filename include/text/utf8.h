#pragma once

#include <string>

namespace picmod {

/**
 * @brief UTF-8 解码，非法字节序列替换为 U+FFFD
 */
inline std::u32string DecodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) {
            cp = c;
            len = 1;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            len = 4;
        } else {
            out.push_back(0xFFFD);
            i++;
            continue;
        }

        if (i + len > text.size()) {
            out.push_back(0xFFFD);
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < len; k++) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            out.push_back(0xFFFD);
            i++;
            continue;
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

} // namespace picmod
