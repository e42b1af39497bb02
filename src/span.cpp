#include "span.hpp"

namespace code_mt {

const char* span_kind_name(SpanKind kind) {
    switch (kind) {
    case SpanKind::LineComment:
        return "line comment";
    case SpanKind::BlockComment:
        return "block comment";
    case SpanKind::Docstring:
        return "docstring";
    case SpanKind::StringLiteral:
        return "string literal";
    }
    return "unknown";
}

const char* file_status_name(FileStatus status) {
    switch (status) {
    case FileStatus::Pending:
        return "pending";
    case FileStatus::Extracted:
        return "extracted";
    case FileStatus::Translated:
        return "translated";
    case FileStatus::Rewritten:
        return "rewritten";
    case FileStatus::Skipped:
        return "skipped";
    case FileStatus::Failed:
        return "failed";
    }
    return "unknown";
}

}  // namespace code_mt
