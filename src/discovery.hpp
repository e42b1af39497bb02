#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace code_mt {

struct DiscoveryOptions {
    bool recursive = true;
    std::vector<std::string> skip_dirs;
    std::vector<std::string> skip_extensions;
};

struct DiscoveryResult {
    // Sorted, each path once, all with a registered language profile.
    std::vector<std::filesystem::path> files;
    std::size_t unsupported = 0;
    std::size_t excluded = 0;
};

// A regular file is taken as is (when supported); a directory is walked.
// Fails when the input does not exist or yields no supported file.
bool collect_source_files(
    const std::filesystem::path& input,
    const DiscoveryOptions& options,
    DiscoveryResult& out,
    std::string& error
);

}  // namespace code_mt
