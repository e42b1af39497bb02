#include "diff.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace code_mt {

namespace {

// Lines keep their terminating '\n'; the last one may lack it.
std::vector<std::string_view> split_lines(std::string_view s) {
    std::vector<std::string_view> lines;
    std::size_t begin = 0;
    while (begin < s.size()) {
        const std::size_t nl = s.find('\n', begin);
        const std::size_t end = nl == std::string_view::npos ? s.size() : nl + 1;
        lines.push_back(s.substr(begin, end - begin));
        begin = end;
    }
    return lines;
}

std::vector<std::size_t> line_starts(const std::vector<std::string_view>& lines, std::string_view s) {
    std::vector<std::size_t> starts;
    starts.reserve(lines.size());
    for (const auto& line : lines) {
        starts.push_back(static_cast<std::size_t>(line.data() - s.data()));
    }
    return starts;
}

std::size_t line_of(const std::vector<std::size_t>& starts, std::size_t offset) {
    if (starts.empty()) {
        return 0;
    }
    const auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    const std::size_t index = it == starts.begin() ? 0 : static_cast<std::size_t>(it - starts.begin()) - 1;
    return std::min(index, starts.size() - 1);
}

// Index of the line holding `offset`. An offset at the very end names the
// line after the last one, unless the text ends mid-line.
std::size_t line_index(const std::vector<std::size_t>& starts, std::string_view text, std::size_t offset) {
    if (offset < text.size()) {
        return line_of(starts, offset);
    }
    if (text.empty() || text.back() == '\n') {
        return starts.size();
    }
    return starts.size() - 1;
}

bool at_line_start(std::string_view text, std::size_t offset) {
    return offset == 0 || (offset <= text.size() && text[offset - 1] == '\n');
}

// Changed line ranges, half-open, in both buffers.
struct Block {
    std::size_t a_begin = 0;
    std::size_t a_end = 0;
    std::size_t b_begin = 0;
    std::size_t b_end = 0;
};

void emit_line(std::ostringstream& out, char tag, std::string_view line) {
    out << tag << line;
    if (!line.ends_with('\n')) {
        out << "\n\\ No newline at end of file\n";
    }
}

std::size_t hunk_start(std::size_t begin, std::size_t count) {
    return count == 0 ? begin : begin + 1;
}

struct HunkLine {
    char tag = ' ';
    std::string text;
};

bool parse_range(const std::string& range, std::size_t& start, std::size_t& count) {
    const auto comma = range.find(',');
    char* end = nullptr;
    start = std::strtoul(range.c_str(), &end, 10);
    if (end == range.c_str()) {
        return false;
    }
    if (comma == std::string::npos) {
        count = 1;
        return true;
    }
    const std::string tail = range.substr(comma + 1);
    count = std::strtoul(tail.c_str(), &end, 10);
    return end != tail.c_str();
}

bool parse_hunk_header(std::string_view line, std::size_t& old_start, std::size_t& old_count) {
    // @@ -a,b +c,d @@
    std::istringstream in{std::string(line)};
    std::string at, old_range, new_range;
    in >> at >> old_range >> new_range;
    if (at != "@@" || old_range.size() < 2 || old_range[0] != '-' || new_range.empty() || new_range[0] != '+') {
        return false;
    }
    return parse_range(old_range.substr(1), old_start, old_count);
}

}  // namespace

std::string make_unified_diff(
    const std::string& label,
    std::string_view before,
    std::string_view after,
    const std::vector<Edit>& edits,
    std::size_t context
) {
    if (edits.empty()) {
        return {};
    }

    const auto old_lines = split_lines(before);
    const auto new_lines = split_lines(after);
    const auto old_starts = line_starts(old_lines, before);
    const auto new_starts = line_starts(new_lines, after);

    std::vector<Block> blocks;
    for (const auto& edit : edits) {
        // Both sides run to the end of the line holding the edit's end, so the
        // unchanged rest of that line is carried by the block on each side. Only
        // when both ends fall on a line start can the block stop there.
        const bool ends_on_boundary =
            at_line_start(before, edit.old_end) && at_line_start(after, edit.new_end);
        Block block;
        block.a_begin = line_index(old_starts, before, edit.old_begin);
        block.b_begin = line_index(new_starts, after, edit.new_begin);
        block.a_end = line_index(old_starts, before, edit.old_end);
        block.b_end = line_index(new_starts, after, edit.new_end);
        if (!ends_on_boundary) {
            block.a_end = std::min(block.a_end + 1, old_lines.size());
            block.b_end = std::min(block.b_end + 1, new_lines.size());
        }

        // Edits sharing a line collapse into one block.
        if (!blocks.empty() && (block.a_begin < blocks.back().a_end || block.b_begin < blocks.back().b_end)) {
            blocks.back().a_end = std::max(blocks.back().a_end, block.a_end);
            blocks.back().b_end = std::max(blocks.back().b_end, block.b_end);
            continue;
        }
        blocks.push_back(block);
    }

    std::ostringstream out;
    out << "--- a/" << label << "\n";
    out << "+++ b/" << label << "\n";

    std::size_t i = 0;
    while (i < blocks.size()) {
        std::size_t j = i;
        while (j + 1 < blocks.size() && blocks[j + 1].a_begin <= blocks[j].a_end + 2 * context) {
            ++j;
        }

        const Block& first = blocks[i];
        const Block& last = blocks[j];
        const std::size_t lead = std::min(context, first.a_begin);
        const std::size_t h_a_begin = first.a_begin - lead;
        const std::size_t h_b_begin = first.b_begin - lead;
        const std::size_t trail = std::min(context, old_lines.size() - last.a_end);
        const std::size_t h_a_end = last.a_end + trail;
        const std::size_t h_b_end = last.b_end + trail;

        const std::size_t old_count = h_a_end - h_a_begin;
        const std::size_t new_count = h_b_end - h_b_begin;
        out << "@@ -" << hunk_start(h_a_begin, old_count) << "," << old_count
            << " +" << hunk_start(h_b_begin, new_count) << "," << new_count << " @@\n";

        std::size_t cursor = h_a_begin;
        for (std::size_t k = i; k <= j; ++k) {
            const Block& block = blocks[k];
            for (; cursor < block.a_begin; ++cursor) {
                emit_line(out, ' ', old_lines[cursor]);
            }
            for (std::size_t a = block.a_begin; a < block.a_end; ++a) {
                emit_line(out, '-', old_lines[a]);
            }
            for (std::size_t b = block.b_begin; b < block.b_end; ++b) {
                emit_line(out, '+', new_lines[b]);
            }
            cursor = block.a_end;
        }
        for (; cursor < h_a_end; ++cursor) {
            emit_line(out, ' ', old_lines[cursor]);
        }

        i = j + 1;
    }

    return out.str();
}

bool apply_unified_diff(std::string_view before, std::string_view diff, std::string& out, std::string& error) {
    out.clear();
    const auto old_lines = split_lines(before);
    const auto diff_lines = split_lines(diff);

    std::size_t cursor = 0;
    std::size_t d = 0;

    // Headers before the first hunk.
    while (d < diff_lines.size() && !diff_lines[d].starts_with("@@")) {
        ++d;
    }

    while (d < diff_lines.size()) {
        std::size_t old_start = 0;
        std::size_t old_count = 0;
        if (!parse_hunk_header(diff_lines[d], old_start, old_count)) {
            error = "Malformed hunk header: " + std::string(diff_lines[d]);
            return false;
        }
        ++d;

        std::vector<HunkLine> body;
        while (d < diff_lines.size() && !diff_lines[d].starts_with("@@")) {
            const std::string_view line = diff_lines[d];
            ++d;
            if (line.empty()) {
                continue;
            }
            if (line[0] == '\\') {
                if (body.empty() || !body.back().text.ends_with('\n')) {
                    error = "Misplaced no-newline marker";
                    return false;
                }
                body.back().text.pop_back();
                continue;
            }
            if (line[0] != ' ' && line[0] != '-' && line[0] != '+') {
                error = "Unexpected diff line: " + std::string(line);
                return false;
            }
            HunkLine hunk_line;
            hunk_line.tag = line[0];
            hunk_line.text = std::string(line.substr(1));
            body.push_back(std::move(hunk_line));
        }

        const std::size_t hunk_begin = old_count == 0 ? old_start : old_start - 1;
        if (hunk_begin < cursor || hunk_begin > old_lines.size()) {
            error = "Hunk at line " + std::to_string(old_start) + " is out of order or out of range";
            return false;
        }
        for (; cursor < hunk_begin; ++cursor) {
            out.append(old_lines[cursor]);
        }

        for (const auto& hunk_line : body) {
            if (hunk_line.tag == '+') {
                out.append(hunk_line.text);
                continue;
            }
            if (cursor >= old_lines.size() || old_lines[cursor] != hunk_line.text) {
                error = "Context mismatch at line " + std::to_string(cursor + 1);
                return false;
            }
            if (hunk_line.tag == ' ') {
                out.append(old_lines[cursor]);
            }
            ++cursor;
        }
    }

    for (; cursor < old_lines.size(); ++cursor) {
        out.append(old_lines[cursor]);
    }
    return true;
}

}  // namespace code_mt
