#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace code_mt {

// Strict UTF-8 check (no overlongs, no surrogates). On failure `bad_off`
// holds the byte offset of the offending sequence.
bool validate_utf8(std::string_view s, std::size_t& bad_off);

// Number of code points; continuation bytes are not counted.
std::size_t count_code_points(std::string_view s);

// True when `s` contains a letter from a non-Latin script (CJK, kana, hangul,
// Cyrillic, Greek, Arabic, Hebrew, Thai, Devanagari).
bool contains_foreign_script(std::string_view s);

bool is_blank(std::string_view s);

std::string_view trim_view(std::string_view s);

}  // namespace code_mt
