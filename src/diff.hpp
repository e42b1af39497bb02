#pragma once

#include "rewriter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace code_mt {

inline constexpr std::size_t kDiffContextLines = 3;

// Unified diff of `before` -> `after`, built from the rewriter's edits rather
// than by re-comparing the buffers. Empty when `edits` is empty.
std::string make_unified_diff(
    const std::string& label,
    std::string_view before,
    std::string_view after,
    const std::vector<Edit>& edits,
    std::size_t context = kDiffContextLines
);

// Applies a unified diff produced by make_unified_diff to `before`. Context and
// removed lines are verified against `before`.
bool apply_unified_diff(std::string_view before, std::string_view diff, std::string& out, std::string& error);

}  // namespace code_mt
