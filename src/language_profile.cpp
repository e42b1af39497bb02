#include "language_profile.hpp"

#include <algorithm>
#include <cctype>

namespace code_mt {

namespace {

LexRule line_comment(std::string_view open) {
    LexRule rule;
    rule.kind = SpanKind::LineComment;
    rule.open = open;
    return rule;
}

LexRule line_doc(std::string_view open) {
    LexRule rule;
    rule.kind = SpanKind::Docstring;
    rule.open = open;
    return rule;
}

LexRule block_comment(std::string_view open, std::string_view close, bool nests) {
    LexRule rule;
    rule.kind = SpanKind::BlockComment;
    rule.open = open;
    rule.close = close;
    rule.nests = nests;
    return rule;
}

LexRule block_doc(std::string_view open, std::string_view close, bool nests, std::string_view nest_open = {}) {
    LexRule rule;
    rule.kind = SpanKind::Docstring;
    rule.open = open;
    rule.close = close;
    rule.nests = nests;
    rule.nest_open = nest_open;
    return rule;
}

LexRule quoted_doc(std::string_view quote) {
    LexRule rule;
    rule.kind = SpanKind::Docstring;
    rule.open = quote;
    rule.close = quote;
    rule.escape = '\\';
    return rule;
}

LexRule string_literal(std::string_view open, std::string_view close, char escape, bool single_line) {
    LexRule rule;
    rule.kind = SpanKind::StringLiteral;
    rule.open = open;
    rule.close = close;
    rule.escape = escape;
    rule.single_line = single_line;
    return rule;
}

LexRule raw_string_literal() {
    LexRule rule = string_literal("R\"", "\"", '\0', false);
    rule.raw_delimiter = true;
    return rule;
}

LexRule char_literal() {
    LexRule rule = string_literal("'", "'", '\\', true);
    rule.char_literal = true;
    return rule;
}

std::vector<LanguageProfile> make_builtin_profiles() {
    std::vector<LanguageProfile> profiles;

    profiles.push_back(LanguageProfile{
        "python",
        {".py", ".pyw", ".pyi"},
        {
            string_literal("\"", "\"", '\\', true),
            string_literal("'", "'", '\\', true),
            quoted_doc("\"\"\""),
            quoted_doc("'''"),
            line_comment("#"),
        },
    });

    profiles.push_back(LanguageProfile{
        "javascript",
        {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx"},
        {
            string_literal("\"", "\"", '\\', true),
            string_literal("'", "'", '\\', true),
            string_literal("`", "`", '\\', false),
            block_doc("/**", "*/", false),
            block_comment("/*", "*/", false),
            line_comment("//"),
        },
    });

    profiles.push_back(LanguageProfile{
        "java",
        {".java"},
        {
            string_literal("\"\"\"", "\"\"\"", '\\', false),
            string_literal("\"", "\"", '\\', true),
            char_literal(),
            block_doc("/**", "*/", false),
            block_comment("/*", "*/", false),
            line_comment("//"),
        },
    });

    profiles.push_back(LanguageProfile{
        "go",
        {".go"},
        {
            string_literal("\"", "\"", '\\', true),
            char_literal(),
            string_literal("`", "`", '\0', false),
            block_comment("/*", "*/", false),
            line_comment("//"),
        },
    });

    // Rust block comments nest, doc blocks included.
    profiles.push_back(LanguageProfile{
        "rust",
        {".rs"},
        {
            string_literal("r#\"", "\"#", '\0', false),
            string_literal("r\"", "\"", '\0', false),
            string_literal("\"", "\"", '\\', false),
            char_literal(),
            line_doc("///"),
            line_doc("//!"),
            block_doc("/**", "*/", true, "/*"),
            block_doc("/*!", "*/", true, "/*"),
            block_comment("/*", "*/", true),
            line_comment("//"),
        },
    });

    profiles.push_back(LanguageProfile{
        "c-family",
        {".c", ".h", ".cc", ".cpp", ".cxx", ".hpp", ".hh", ".hxx"},
        {
            raw_string_literal(),
            string_literal("\"", "\"", '\\', true),
            char_literal(),
            block_doc("/**", "*/", false),
            block_comment("/*", "*/", false),
            line_comment("//"),
        },
    });

    profiles.push_back(LanguageProfile{
        "swift",
        {".swift"},
        {
            string_literal("\"\"\"", "\"\"\"", '\\', false),
            string_literal("\"", "\"", '\\', true),
            line_doc("///"),
            block_doc("/**", "*/", true, "/*"),
            block_comment("/*", "*/", true),
            line_comment("//"),
        },
    });

    return profiles;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

const std::vector<LanguageProfile>& builtin_profiles() {
    static const std::vector<LanguageProfile> profiles = make_builtin_profiles();
    return profiles;
}

const LanguageProfile* profile_for(std::string_view extension) {
    const std::string ext = to_lower(extension);
    for (const auto& profile : builtin_profiles()) {
        for (const auto candidate : profile.extensions) {
            if (candidate == ext) {
                return &profile;
            }
        }
    }
    return nullptr;
}

std::vector<std::string> supported_extensions() {
    std::vector<std::string> out;
    for (const auto& profile : builtin_profiles()) {
        for (const auto ext : profile.extensions) {
            out.emplace_back(ext);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace code_mt
