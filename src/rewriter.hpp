#pragma once

#include "extractor.hpp"
#include "language_profile.hpp"
#include "span.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace code_mt {

// One substitution: bytes [old_begin, old_end) of the original became
// [new_begin, new_end) of the rewritten buffer.
struct Edit {
    std::size_t old_begin = 0;
    std::size_t old_end = 0;
    std::size_t new_begin = 0;
    std::size_t new_end = 0;
};

struct RewriteResult {
    std::string buffer;
    std::vector<Edit> edits;
};

// Forward single-pass copy: gap, replacement, gap, ... Offsets are always
// those of the original buffer. `translations` is aligned 1:1 with `spans`;
// a translation equal to the span's raw text produces no edit.
bool rewrite_buffer(
    std::string_view original,
    const std::vector<Span>& spans,
    const std::vector<std::string>& translations,
    RewriteResult& out,
    std::string& error
);

// Re-applies the leading and trailing whitespace of `raw` around the trimmed
// `translated` text.
std::string preserve_margins(std::string_view raw, std::string_view translated);

// Fits `text`, a margin-preserved translation of `span`, into the construct
// the span came from: line constructs get their newlines folded into spaces,
// strings with an escape character get stray closing quotes escaped and (when
// single-line) newlines written as escapes. Returns false with `reason` when
// the text would still end the construct early or turn it into another one.
bool fit_translation(const Span& span, const LanguageProfile& profile, std::string& text, std::string& reason);

// True when `rewritten` lexes into spans of the same kinds, in the same order,
// as `original_spans`.
bool same_structure(
    const std::vector<Span>& original_spans,
    std::string_view rewritten,
    const LanguageProfile& profile,
    const ExtractOptions& options,
    std::string& error
);

// Writes through a sibling temporary file and renames it over `path`, keeping
// the original permissions. `path` is untouched on failure.
bool write_file_atomic(const std::filesystem::path& path, std::string_view bytes, std::string& error);

bool read_file(const std::filesystem::path& path, std::string& out, std::string& error);

}  // namespace code_mt
