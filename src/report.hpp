#pragma once

#include "config.hpp"
#include "pipeline.hpp"
#include "stats.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace code_mt {

// Saves the run as XML: effective settings, one <file> per outcome (sorted by
// path) and the summary counters.
bool write_run_report(
    const std::filesystem::path& out_path,
    const Config& config,
    const std::vector<FileOutcome>& outcomes,
    const RunStats& totals,
    const PoolStats& pool,
    bool interrupted,
    std::string& error
);

}  // namespace code_mt
