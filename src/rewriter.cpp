#include "rewriter.hpp"

#include "text.hpp"

#include <atomic>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <unistd.h>

namespace code_mt {

namespace {

std::atomic<unsigned long> g_temp_counter{0};

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    const auto n = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
    const std::string name = "." + path.filename().string() + ".code-mt-" +
        std::to_string(static_cast<long>(::getpid())) + "-" + std::to_string(n) + ".tmp";
    return path.parent_path() / name;
}

// Runs of CR/LF become one space.
std::string fold_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool in_break = false;
    for (const char c : text) {
        if (c == '\n' || c == '\r') {
            if (!in_break) {
                out.push_back(' ');
            }
            in_break = true;
            continue;
        }
        in_break = false;
        out.push_back(c);
    }
    return out;
}

// Existing escape sequences are kept; an unescaped closing quote gets one.
std::string escape_string_body(std::string_view text, char escape, char quote, bool single_line) {
    std::string out;
    out.reserve(text.size() + 8);
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == escape) {
            out.push_back(c);
            if (i + 1 < text.size()) {
                out.push_back(text[++i]);
            }
            continue;
        }
        if (single_line && (c == '\n' || c == '\r')) {
            out.push_back(escape);
            out.push_back(c == '\n' ? 'n' : 'r');
            continue;
        }
        if (c == quote) {
            out.push_back(escape);
        }
        out.push_back(c);
    }
    return out;
}

const LexRule* string_rule_for(const Span& span, const LanguageProfile& profile) {
    for (const auto& rule : profile.rules) {
        if (rule.kind == SpanKind::StringLiteral && rule.open == span.open && rule.close == span.close) {
            return &rule;
        }
    }
    return nullptr;
}

}  // namespace

bool fit_translation(const Span& span, const LanguageProfile& profile, std::string& text, std::string& reason) {
    if (span.open.empty()) {
        reason = "span has no recorded delimiters";
        return false;
    }

    if (span.close.empty()) {
        text = fold_newlines(text);
    } else if (span.kind == SpanKind::StringLiteral) {
        const LexRule* rule = string_rule_for(span, profile);
        if (rule != nullptr && rule->escape != '\0') {
            text = escape_string_body(text, rule->escape, rule->close.front(), rule->single_line);
        }
    }

    // Re-lex the construct on its own: it must come back as exactly one span
    // of the same kind covering all of `text`.
    std::string snippet = span.open;
    snippet += text;
    snippet += span.close.empty() ? std::string("\n") : span.close;

    ExtractOptions options;
    options.translate_all = true;
    ExtractResult relexed;
    try {
        relexed = extract_spans(snippet, profile, options);
    } catch (const ExtractionError& ex) {
        reason = ex.what();
        return false;
    }

    if (!relexed.warnings.empty()) {
        reason = relexed.warnings.front();
        return false;
    }
    const bool intact = relexed.spans.size() == 1 &&
        relexed.spans.front().kind == span.kind &&
        relexed.spans.front().start == span.open.size() &&
        relexed.spans.front().end == span.open.size() + text.size();
    if (!intact) {
        reason = std::string("translation would break out of the ") + span_kind_name(span.kind);
        return false;
    }
    return true;
}

bool same_structure(
    const std::vector<Span>& original_spans,
    std::string_view rewritten,
    const LanguageProfile& profile,
    const ExtractOptions& options,
    std::string& error
) {
    ExtractResult relexed;
    try {
        relexed = extract_spans(rewritten, profile, options);
    } catch (const ExtractionError& ex) {
        error = ex.what();
        return false;
    }

    if (relexed.spans.size() != original_spans.size()) {
        error = std::to_string(original_spans.size()) + " span(s) became " + std::to_string(relexed.spans.size());
        return false;
    }
    for (std::size_t i = 0; i < original_spans.size(); ++i) {
        if (relexed.spans[i].kind != original_spans[i].kind) {
            error = "span " + std::to_string(i + 1) + " changed from " + span_kind_name(original_spans[i].kind) +
                " to " + span_kind_name(relexed.spans[i].kind);
            return false;
        }
    }
    return true;
}

bool rewrite_buffer(
    std::string_view original,
    const std::vector<Span>& spans,
    const std::vector<std::string>& translations,
    RewriteResult& out,
    std::string& error
) {
    out = RewriteResult{};

    if (translations.size() != spans.size()) {
        error = "Translation count does not match span count for rewriter";
        return false;
    }

    out.buffer.reserve(original.size());
    std::size_t prev_end = 0;

    for (std::size_t i = 0; i < spans.size(); ++i) {
        const Span& span = spans[i];
        if (span.start < prev_end || span.end < span.start || span.end > original.size()) {
            error = "Span " + std::to_string(i) + " [" + std::to_string(span.start) + ", " +
                std::to_string(span.end) + ") overlaps its predecessor or leaves the buffer";
            return false;
        }

        out.buffer.append(original.substr(prev_end, span.start - prev_end));

        const std::string_view before = original.substr(span.start, span.end - span.start);
        const std::string& after = translations[i];
        if (after != before) {
            Edit edit;
            edit.old_begin = span.start;
            edit.old_end = span.end;
            edit.new_begin = out.buffer.size();
            out.buffer.append(after);
            edit.new_end = out.buffer.size();
            out.edits.push_back(edit);
        } else {
            out.buffer.append(before);
        }

        prev_end = span.end;
    }

    out.buffer.append(original.substr(prev_end));
    return true;
}

std::string preserve_margins(std::string_view raw, std::string_view translated) {
    const std::string_view core = trim_view(raw);
    if (core.empty()) {
        return std::string(raw);
    }

    const std::size_t lead = static_cast<std::size_t>(core.data() - raw.data());
    const std::size_t trail = raw.size() - lead - core.size();

    std::string out;
    out.reserve(raw.size() + translated.size());
    out.append(raw.substr(0, lead));
    out.append(trim_view(translated));
    out.append(raw.substr(raw.size() - trail));
    return out;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view bytes, std::string& error) {
    std::error_code ec;
    const auto perms = std::filesystem::status(path, ec).permissions();
    const bool had_perms = !ec;

    const auto tmp = temp_path_for(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "Failed to create temporary file: " + tmp.string();
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            error = "Failed to write temporary file: " + tmp.string();
            return false;
        }
    }

    if (had_perms) {
        std::filesystem::permissions(tmp, perms, std::filesystem::perm_options::replace, ec);
        if (ec) {
            const std::string reason = ec.message();
            std::filesystem::remove(tmp, ec);
            error = "Failed to copy permissions to " + tmp.string() + ": " + reason;
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        error = "Failed to replace " + path.string() + ": " + reason;
        return false;
    }

    return true;
}

bool read_file(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open " + path.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Failed to read " + path.string();
        return false;
    }
    return true;
}

}  // namespace code_mt
