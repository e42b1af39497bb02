#include "extractor.hpp"

#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <variant>

namespace code_mt {

namespace {

constexpr int kMaxNestingDepth = 64;

int kind_priority(SpanKind kind) {
    switch (kind) {
    case SpanKind::StringLiteral:
        return 0;
    case SpanKind::Docstring:
        return 1;
    case SpanKind::BlockComment:
        return 2;
    case SpanKind::LineComment:
        return 3;
    }
    return 4;
}

struct InCode {};

struct InLineComment {
    const LexRule* rule = nullptr;
    std::size_t body_start = 0;
};

struct InBlockComment {
    const LexRule* rule = nullptr;
    std::size_t body_start = 0;
    int depth = 1;
};

struct InString {
    const LexRule* rule = nullptr;
    std::size_t open_start = 0;
    std::size_t body_start = 0;
    // Effective closer; differs from the rule's for delimited raw strings.
    std::string close;
};

struct InDocstring {
    const LexRule* rule = nullptr;
    std::size_t body_start = 0;
    int depth = 1;
};

using ScanState = std::variant<InCode, InLineComment, InBlockComment, InString, InDocstring>;

class Scanner {
public:
    Scanner(std::string_view buffer, const LanguageProfile& profile, const ExtractOptions& options)
        : buffer_(buffer), profile_(profile), options_(options) {}

    ExtractResult run() {
        ScanState state = InCode{};
        while (pos_ < buffer_.size()) {
            state = std::visit([this](auto& s) { return step(s); }, state);
        }
        std::visit([this](auto& s) { finish(s); }, state);
        return std::move(result_);
    }

    // Transitions. Each consumes at least one byte or switches state.
    ScanState step(InCode&) {
        const LexRule* rule = match_open(pos_);
        if (rule == nullptr) {
            check_stray_closer();
            ++pos_;
            return InCode{};
        }

        const std::size_t open_start = pos_;
        std::size_t body_start = pos_ + rule->open.size();
        std::string close(rule->close);
        if (rule->raw_delimiter) {
            const std::size_t delimiter = raw_delimiter_length(body_start);
            close = ")" + std::string(buffer_.substr(body_start, delimiter)) + close;
            body_start += delimiter + 1;
        }
        pos_ = body_start;
        switch (rule->kind) {
        case SpanKind::StringLiteral:
            return InString{rule, open_start, body_start, std::move(close)};
        case SpanKind::Docstring:
            return InDocstring{rule, body_start, 1};
        case SpanKind::BlockComment:
            return InBlockComment{rule, body_start, 1};
        case SpanKind::LineComment:
            return InLineComment{rule, body_start};
        }
        return InCode{};
    }

    ScanState step(InLineComment& s) {
        close_at_eol(*s.rule, s.body_start);
        return InCode{};
    }

    ScanState step(InBlockComment& s) {
        if (scan_block(*s.rule, s.depth)) {
            emit(*s.rule, s.body_start, pos_);
            pos_ += s.rule->close.size();
            return InCode{};
        }
        return s;
    }

    ScanState step(InDocstring& s) {
        if (s.rule->close.empty()) {
            close_at_eol(*s.rule, s.body_start);
            return InCode{};
        }
        if (scan_block(*s.rule, s.depth)) {
            emit(*s.rule, s.body_start, pos_);
            pos_ += s.rule->close.size();
            return InCode{};
        }
        return s;
    }

    ScanState step(InString& s) {
        const LexRule& rule = *s.rule;
        const char c = buffer_[pos_];

        if (rule.escape != '\0' && c == rule.escape) {
            pos_ = std::min(pos_ + 2, buffer_.size());
            return std::move(s);
        }
        if (starts_with_at(pos_, s.close)) {
            if (options_.translate_all) {
                emit_string(s, pos_);
            }
            pos_ += s.close.size();
            return InCode{};
        }
        if (rule.single_line && c == '\n') {
            warn("unterminated string literal", s.body_start);
            if (options_.translate_all) {
                emit_string(s, line_end_before(pos_));
            }
            return InCode{};
        }
        ++pos_;
        return std::move(s);
    }

    // End of buffer reached inside a construct: close it implicitly.
    void finish(InCode&) {}
    void finish(InLineComment& s) { emit(*s.rule, s.body_start, line_end_before(buffer_.size())); }

    void finish(InBlockComment& s) {
        warn("unterminated block comment", s.body_start);
        emit(*s.rule, s.body_start, buffer_.size());
    }

    void finish(InDocstring& s) {
        if (!s.rule->close.empty()) {
            warn("unterminated docstring", s.body_start);
        }
        emit(*s.rule, s.body_start, buffer_.size());
    }

    void finish(InString& s) {
        warn("unterminated string literal", s.body_start);
        if (options_.translate_all) {
            emit_string(s, buffer_.size());
        }
    }

private:
    bool starts_with_at(std::size_t pos, std::string_view marker) const {
        return !marker.empty() && pos <= buffer_.size() && buffer_.substr(pos).starts_with(marker);
    }

    // An opener whose closer begins inside the opener itself ("/**/") is an
    // empty construct of the shorter rule, not an open doc block.
    bool closes_inside_opener(const LexRule& rule, std::size_t pos) const {
        if (rule.kind != SpanKind::Docstring || rule.close.empty() || rule.open == rule.close) {
            return false;
        }
        const std::size_t max_overlap = std::min(rule.open.size(), rule.close.size()) - 1;
        for (std::size_t k = 1; k <= max_overlap; ++k) {
            if (rule.open.ends_with(rule.close.substr(0, k)) &&
                starts_with_at(pos + rule.open.size() - k, rule.close)) {
                return true;
            }
        }
        return false;
    }

    bool char_literal_at(std::size_t pos, const LexRule& rule) const {
        if (pos > 0) {
            const unsigned char prev = static_cast<unsigned char>(buffer_[pos - 1]);
            if (std::isalnum(prev) || prev == '_') {
                return false;
            }
        }

        std::size_t p = pos + rule.open.size();
        if (p >= buffer_.size() || starts_with_at(p, rule.close)) {
            return false;
        }

        if (buffer_[p] == rule.escape) {
            // '\n', '\'', '\x7f', '\u{10ffff}'
            const std::size_t limit = std::min(buffer_.size(), p + 12);
            for (std::size_t q = p + 2; q < limit; ++q) {
                if (std::isspace(static_cast<unsigned char>(buffer_[q]))) {
                    return false;
                }
                if (starts_with_at(q, rule.close)) {
                    return true;
                }
            }
            return false;
        }

        const unsigned char lead = static_cast<unsigned char>(buffer_[p]);
        std::size_t len = 1;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
        }
        return buffer_[p] != '\n' && starts_with_at(p + len, rule.close);
    }

    // Length of a raw-string delimiter at `pos` up to its '(', or npos when
    // the characters there cannot form one.
    std::size_t raw_delimiter_length(std::size_t pos) const {
        constexpr std::size_t kMaxDelimiter = 16;
        for (std::size_t n = 0; n <= kMaxDelimiter && pos + n < buffer_.size(); ++n) {
            const char c = buffer_[pos + n];
            if (c == '(') {
                return n;
            }
            if (c == ')' || c == '\\' || c == '"' || std::isspace(static_cast<unsigned char>(c))) {
                return std::string_view::npos;
            }
        }
        return std::string_view::npos;
    }

    const LexRule* match_open(std::size_t pos) const {
        const LexRule* best = nullptr;
        for (const auto& rule : profile_.rules) {
            if (!starts_with_at(pos, rule.open) || closes_inside_opener(rule, pos)) {
                continue;
            }
            if (rule.char_literal && !char_literal_at(pos, rule)) {
                continue;
            }
            if (rule.raw_delimiter && raw_delimiter_length(pos + rule.open.size()) == std::string_view::npos) {
                continue;
            }
            if (best == nullptr || rule.open.size() > best->open.size() ||
                (rule.open.size() == best->open.size() && kind_priority(rule.kind) < kind_priority(best->kind))) {
                best = &rule;
            }
        }
        return best;
    }

    void check_stray_closer() const {
        for (const auto& rule : profile_.rules) {
            if (rule.kind != SpanKind::BlockComment || !rule.nests) {
                continue;
            }
            if (starts_with_at(pos_, rule.close) && match_open(pos_ + 1) == nullptr) {
                throw ExtractionError(
                    "unbalanced '" + std::string(rule.close) + "' outside any comment at line " +
                    std::to_string(line_of(pos_))
                );
            }
        }
    }

    // Advances through a block body. Returns true with pos_ on the balanced
    // closer; false when more input is needed.
    bool scan_block(const LexRule& rule, int& depth) {
        const std::string_view nest_open = rule.nest_open.empty() ? rule.open : rule.nest_open;

        if (rule.escape != '\0' && buffer_[pos_] == rule.escape) {
            pos_ = std::min(pos_ + 2, buffer_.size());
            return false;
        }
        if (rule.nests && starts_with_at(pos_, nest_open)) {
            ++depth;
            if (depth > kMaxNestingDepth) {
                throw ExtractionError(
                    "block comment nesting deeper than " + std::to_string(kMaxNestingDepth) +
                    " at line " + std::to_string(line_of(pos_))
                );
            }
            pos_ += nest_open.size();
            return false;
        }
        if (starts_with_at(pos_, rule.close)) {
            if (!rule.nests || depth == 1) {
                return true;
            }
            --depth;
            pos_ += rule.close.size();
            return false;
        }
        ++pos_;
        return false;
    }

    void close_at_eol(const LexRule& rule, std::size_t body_start) {
        const std::size_t nl = buffer_.find('\n', pos_);
        pos_ = nl == std::string_view::npos ? buffer_.size() : nl;
        emit(rule, body_start, line_end_before(pos_));
    }

    // Excludes the '\r' of a CRLF ending.
    std::size_t line_end_before(std::size_t pos) const {
        if (pos > 0 && pos <= buffer_.size() && buffer_[pos - 1] == '\r') {
            return pos - 1;
        }
        return pos;
    }

    void emit(const LexRule& rule, std::size_t start, std::size_t end) {
        emit_span(rule.kind, start, end, rule.open, rule.close);
    }

    void emit_string(const InString& s, std::size_t end) {
        emit_span(s.rule->kind, s.body_start, end,
            buffer_.substr(s.open_start, s.body_start - s.open_start), s.close);
    }

    void emit_span(SpanKind kind, std::size_t start, std::size_t end, std::string_view open, std::string_view close) {
        end = std::max(start, end);
        Span span;
        span.start = start;
        span.end = end;
        span.kind = kind;
        span.raw_text = std::string(buffer_.substr(start, end - start));
        span.open = std::string(open);
        span.close = std::string(close);
        result_.spans.push_back(std::move(span));
    }

    void warn(const std::string& what, std::size_t offset) {
        result_.warnings.push_back(what + " starting at line " + std::to_string(line_of(offset)));
    }

    std::size_t line_of(std::size_t offset) const {
        offset = std::min(offset, buffer_.size());
        return 1 + static_cast<std::size_t>(std::count(buffer_.begin(), buffer_.begin() + offset, '\n'));
    }

    std::string_view buffer_;
    const LanguageProfile& profile_;
    const ExtractOptions& options_;
    std::size_t pos_ = 0;
    ExtractResult result_;
};

}  // namespace

ExtractResult extract_spans(std::string_view buffer, const LanguageProfile& profile, const ExtractOptions& options) {
    Scanner scanner(buffer, profile, options);
    return scanner.run();
}

std::vector<std::size_t> select_translatable(const std::vector<Span>& spans, const SelectOptions& options) {
    std::vector<std::size_t> out;
    out.reserve(spans.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto& text = spans[i].raw_text;
        if (is_blank(text)) {
            continue;
        }
        if (options.require_foreign_text && !contains_foreign_script(text)) {
            continue;
        }
        out.push_back(i);
    }
    return out;
}

}  // namespace code_mt
