#pragma once

#include "span.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace code_mt {

// One lexical construct of a language. An empty `close` means the construct
// ends at end-of-line (exclusive of the newline).
struct LexRule {
    SpanKind kind = SpanKind::LineComment;
    std::string_view open;
    std::string_view close;
    bool nests = false;
    // Opener counted for nesting depth; empty means `open` itself.
    std::string_view nest_open;
    char escape = '\0';
    // Strings only: an unescaped newline terminates the literal.
    bool single_line = false;
    // Quote starts a literal only around a single code point or an escape
    // ('x', '\n'); otherwise it is code (lifetimes, digit separators).
    bool char_literal = false;
    // C++ raw strings: `open` is followed by a delimiter of at most 16
    // characters and '('; the literal ends at ')' + delimiter + `close`.
    bool raw_delimiter = false;
};

struct LanguageProfile {
    std::string_view id;
    std::vector<std::string_view> extensions;
    std::vector<LexRule> rules;
};

// Returns the built-in profile registered for `extension` (".rs", ".PY", ...),
// or nullptr when the language is not supported.
const LanguageProfile* profile_for(std::string_view extension);

const std::vector<LanguageProfile>& builtin_profiles();

std::vector<std::string> supported_extensions();

}  // namespace code_mt
