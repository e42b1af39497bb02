#pragma once

#include "span.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace code_mt {

struct FileOutcome {
    std::filesystem::path path;
    FileStatus status = FileStatus::Pending;
    std::string reason;
    std::size_t spans_found = 0;
    std::size_t spans_selected = 0;
    std::size_t spans_translated = 0;
    std::size_t chunks = 0;
    std::size_t chunks_failed = 0;
    std::vector<std::string> warnings;
    // Dry-run only: unified diff of the would-be rewrite.
    std::string diff;
    bool written = false;
    std::chrono::milliseconds elapsed{0};
};

struct RunStats {
    std::size_t processed = 0;
    std::size_t translated = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t spans_translated = 0;
    std::size_t chunks_failed = 0;
    std::size_t warnings = 0;
};

using OutcomeSink = std::function<void(const FileOutcome&, const RunStats&)>;

// The one place workers publish results to. Counters only grow; the sink runs
// under the same lock, so console output from workers never interleaves.
class StatsCollector {
public:
    explicit StatsCollector(OutcomeSink sink = {});

    void record(FileOutcome outcome);

    RunStats snapshot() const;

    // Recorded outcomes sorted by path.
    std::vector<FileOutcome> outcomes() const;

private:
    mutable std::mutex mutex_;
    RunStats stats_;
    std::vector<FileOutcome> outcomes_;
    OutcomeSink sink_;
};

}  // namespace code_mt
