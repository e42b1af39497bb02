#pragma once

#include "chunker.hpp"
#include "extractor.hpp"
#include "gateway.hpp"
#include "span.hpp"
#include "stats.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace code_mt {

struct PipelineOptions {
    ExtractOptions extract;
    SelectOptions select;
    std::size_t max_chunk_chars = kDefaultMaxChunkChars;
    std::string source_lang;
    std::string target_lang;
    RetryPolicy retry;
    std::chrono::milliseconds timeout{120000};
    bool dry_run = false;
    std::uintmax_t max_file_bytes = 1024 * 1024;
    // Diff labels are relative to this directory when set.
    std::filesystem::path label_root;
};

struct RunControl {
    std::atomic<bool> cancel_requested{false};
};

struct PoolStats {
    std::size_t files_total = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
};

// Drives one job from Pending to Rewritten/Skipped/Failed. Never throws; the
// file on disk is either fully replaced or untouched.
FileOutcome process_file(
    FileJob& job,
    const PipelineOptions& options,
    TranslationGateway& gateway,
    const RunControl* control = nullptr
);

// Bounded pool over `files`: each worker clones `prototype` and pulls the next
// path until the list is exhausted or cancellation is requested. Every
// processed file is recorded in `stats`. Returns false only when the pool
// itself could not run (a worker could not obtain a gateway).
bool run_worker_pool(
    const std::vector<std::filesystem::path>& files,
    const PipelineOptions& options,
    const TranslationGateway& prototype,
    std::size_t workers,
    RunControl& control,
    StatsCollector& stats,
    PoolStats& out_pool,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);

}  // namespace code_mt
