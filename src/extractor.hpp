#pragma once

#include "language_profile.hpp"
#include "span.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace code_mt {

class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExtractOptions {
    bool translate_all = false;
};

struct ExtractResult {
    std::vector<Span> spans;
    std::vector<std::string> warnings;
};

// Single pass over `buffer`. Spans come back sorted by start offset and
// non-overlapping; zero-length spans are kept. Unterminated constructs close at
// end of buffer (or end of line for single-line strings) with a warning.
// Throws ExtractionError when the nesting structure cannot be recovered.
ExtractResult extract_spans(std::string_view buffer, const LanguageProfile& profile, const ExtractOptions& options);

struct SelectOptions {
    bool require_foreign_text = true;
};

// Indices of the spans worth sending to the gateway: never blank ones, and
// only those with foreign-script text when `require_foreign_text` is set.
std::vector<std::size_t> select_translatable(const std::vector<Span>& spans, const SelectOptions& options);

}  // namespace code_mt
