#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace code_mt {

enum class SpanKind {
    LineComment,
    BlockComment,
    Docstring,
    StringLiteral
};

const char* span_kind_name(SpanKind kind);

// Byte range [start, end) of translatable text inside a file buffer.
// Markers (comment openers/closers, quotes) are never part of the span.
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;
    SpanKind kind = SpanKind::LineComment;
    std::string raw_text;
    // Markers as they appear around this span in the buffer. An empty `close`
    // means the construct ends at end-of-line.
    std::string open;
    std::string close;

    std::size_t size() const { return end - start; }
};

// Spans packed for one gateway request. `text` is the separator-joined
// raw text of `spans`, in source order.
struct Chunk {
    std::vector<std::size_t> span_indices;
    std::vector<std::string> texts;
    std::string text;
    std::size_t char_count = 0;
};

enum class FileStatus {
    Pending,
    Extracted,
    Translated,
    Rewritten,
    Skipped,
    Failed
};

const char* file_status_name(FileStatus status);

struct LanguageProfile;

struct FileJob {
    std::filesystem::path path;
    std::string buffer;
    const LanguageProfile* profile = nullptr;
    FileStatus status = FileStatus::Pending;
};

}  // namespace code_mt
