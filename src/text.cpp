#include "text.hpp"

#include <cctype>

namespace code_mt {

namespace {

bool is_cont(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

bool is_foreign_code_point(std::uint32_t cp) {
    return (cp >= 0x0370 && cp <= 0x03FF)     // Greek
        || (cp >= 0x0400 && cp <= 0x04FF)     // Cyrillic
        || (cp >= 0x0590 && cp <= 0x05FF)     // Hebrew
        || (cp >= 0x0600 && cp <= 0x06FF)     // Arabic
        || (cp >= 0x0900 && cp <= 0x097F)     // Devanagari
        || (cp >= 0x0E00 && cp <= 0x0E7F)     // Thai
        || (cp >= 0x1100 && cp <= 0x11FF)     // Hangul Jamo
        || (cp >= 0x3040 && cp <= 0x30FF)     // Hiragana, Katakana
        || (cp >= 0x3400 && cp <= 0x4DBF)     // CJK extension A
        || (cp >= 0x4E00 && cp <= 0x9FFF)     // CJK unified ideographs
        || (cp >= 0xAC00 && cp <= 0xD7AF)     // Hangul syllables
        || (cp >= 0xF900 && cp <= 0xFAFF)     // CJK compatibility
        || (cp >= 0xFF66 && cp <= 0xFF9F)     // half-width katakana
        || (cp >= 0x20000 && cp <= 0x2FA1F);  // CJK extensions B..
}

}  // namespace

bool validate_utf8(std::string_view s, std::size_t& bad_off) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);

        if (b0 < 0x80) {
            i += 1;
            continue;
        }

        std::size_t len = 0;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3;
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4;
        } else {
            bad_off = i;
            return false;
        }

        if (i + len > s.size()) {
            bad_off = i;
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            if (!is_cont(static_cast<unsigned char>(s[i + k]))) {
                bad_off = i;
                return false;
            }
        }

        const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
        if ((b0 == 0xE0 && b1 < 0xA0) || (b0 == 0xED && b1 >= 0xA0) ||
            (b0 == 0xF0 && b1 < 0x90) || (b0 == 0xF4 && b1 > 0x8F)) {
            bad_off = i;
            return false;
        }

        i += len;
    }
    return true;
}

std::size_t count_code_points(std::string_view s) {
    std::size_t n = 0;
    for (const char c : s) {
        if (!is_cont(static_cast<unsigned char>(c))) {
            ++n;
        }
    }
    return n;
}

bool contains_foreign_script(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);
        if (b0 < 0x80) {
            ++i;
            continue;
        }

        std::uint32_t cp = 0;
        std::size_t len = 1;
        if ((b0 & 0xE0) == 0xC0) {
            cp = b0 & 0x1F;
            len = 2;
        } else if ((b0 & 0xF0) == 0xE0) {
            cp = b0 & 0x0F;
            len = 3;
        } else if ((b0 & 0xF8) == 0xF0) {
            cp = b0 & 0x07;
            len = 4;
        } else {
            ++i;
            continue;
        }

        if (i + len > s.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
        }
        if (is_foreign_code_point(cp)) {
            return true;
        }
        i += len;
    }
    return false;
}

bool is_blank(std::string_view s) {
    for (const char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_view(std::string_view s) {
    auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (!s.empty() && is_ws(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ws(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace code_mt
