#pragma once

#include "span.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace code_mt {

inline constexpr std::size_t kDefaultMaxChunkChars = 5000;
inline constexpr std::string_view kSpanSeparator = "\n<|span|>\n";

// Greedy packing of `spans[indices]` in order. A span never straddles two
// chunks; a span larger than `max_chars` gets a chunk of its own. Empty spans
// are left out.
std::vector<Chunk> build_chunks(
    const std::vector<Span>& spans,
    const std::vector<std::size_t>& indices,
    std::size_t max_chars = kDefaultMaxChunkChars
);

std::vector<Chunk> build_chunks(const std::vector<Span>& spans, std::size_t max_chars = kDefaultMaxChunkChars);

std::string join_chunk_text(const std::vector<std::string>& texts);

// Inverse of join_chunk_text for a gateway response. Fails when the number of
// pieces differs from `expected`.
bool split_chunk_text(
    std::string_view joined,
    std::size_t expected,
    std::vector<std::string>& out_pieces,
    std::string& error
);

}  // namespace code_mt
