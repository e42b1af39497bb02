#include "chunker.hpp"

#include "text.hpp"

#include <utility>

namespace code_mt {

namespace {

constexpr std::string_view kSeparatorMarker = "<|span|>";

void close_chunk(Chunk& current, std::vector<Chunk>& out) {
    if (current.span_indices.empty()) {
        return;
    }
    current.text = join_chunk_text(current.texts);
    out.push_back(std::move(current));
    current = Chunk{};
}

}  // namespace

std::vector<Chunk> build_chunks(
    const std::vector<Span>& spans,
    const std::vector<std::size_t>& indices,
    std::size_t max_chars
) {
    const std::size_t separator_chars = count_code_points(kSpanSeparator);

    std::vector<Chunk> out;
    Chunk current;

    for (const std::size_t index : indices) {
        const Span& span = spans.at(index);
        if (span.raw_text.empty()) {
            continue;
        }

        const std::size_t span_chars = count_code_points(span.raw_text);
        const std::size_t added = current.span_indices.empty() ? span_chars : span_chars + separator_chars;

        if (!current.span_indices.empty() && current.char_count + added > max_chars) {
            close_chunk(current, out);
            current.char_count = span_chars;
        } else {
            current.char_count += added;
        }
        current.span_indices.push_back(index);
        current.texts.push_back(span.raw_text);
    }

    close_chunk(current, out);
    return out;
}

std::vector<Chunk> build_chunks(const std::vector<Span>& spans, std::size_t max_chars) {
    std::vector<std::size_t> indices(spans.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
        indices[i] = i;
    }
    return build_chunks(spans, indices, max_chars);
}

std::string join_chunk_text(const std::vector<std::string>& texts) {
    std::string out;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        if (i > 0) {
            out.append(kSpanSeparator);
        }
        out.append(texts[i]);
    }
    return out;
}

bool split_chunk_text(
    std::string_view joined,
    std::size_t expected,
    std::vector<std::string>& out_pieces,
    std::string& error
) {
    out_pieces.clear();

    std::size_t begin = 0;
    while (true) {
        const std::size_t marker = joined.find(kSeparatorMarker, begin);
        std::string_view piece = joined.substr(begin, marker == std::string_view::npos ? joined.size() - begin : marker - begin);

        // The separator's own newlines belong to the separator.
        if (begin > 0 && piece.starts_with('\n')) {
            piece.remove_prefix(1);
        }
        if (marker != std::string_view::npos && piece.ends_with('\n')) {
            piece.remove_suffix(1);
        }
        out_pieces.emplace_back(piece);

        if (marker == std::string_view::npos) {
            break;
        }
        begin = marker + kSeparatorMarker.size();
    }

    if (out_pieces.size() != expected) {
        error = "gateway returned " + std::to_string(out_pieces.size()) + " segments for a chunk of " +
            std::to_string(expected) + " spans";
        out_pieces.clear();
        return false;
    }
    return true;
}

}  // namespace code_mt
