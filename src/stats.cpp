#include "stats.hpp"

#include <algorithm>
#include <utility>

namespace code_mt {

StatsCollector::StatsCollector(OutcomeSink sink) : sink_(std::move(sink)) {}

void StatsCollector::record(FileOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    ++stats_.processed;
    switch (outcome.status) {
    case FileStatus::Rewritten:
        ++stats_.translated;
        break;
    case FileStatus::Failed:
        ++stats_.failed;
        break;
    default:
        ++stats_.skipped;
        break;
    }
    stats_.spans_translated += outcome.spans_translated;
    stats_.chunks_failed += outcome.chunks_failed;
    stats_.warnings += outcome.warnings.size();

    outcomes_.push_back(std::move(outcome));
    if (sink_) {
        sink_(outcomes_.back(), stats_);
    }
}

RunStats StatsCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<FileOutcome> StatsCollector::outcomes() const {
    std::vector<FileOutcome> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = outcomes_;
    }
    std::sort(out.begin(), out.end(), [](const FileOutcome& a, const FileOutcome& b) {
        return a.path < b.path;
    });
    return out;
}

}  // namespace code_mt
