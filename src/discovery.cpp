#include "discovery.hpp"

#include "language_profile.hpp"

#include <algorithm>
#include <cctype>

namespace code_mt {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool has_skipped_extension(const std::filesystem::path& path, const std::vector<std::string>& skip_extensions) {
    // Suffix match so that multi-part entries like ".min.js" work.
    const std::string name = lower(path.filename().string());
    for (const auto& ext : skip_extensions) {
        if (!ext.empty() && name.size() > ext.size() && name.ends_with(lower(ext))) {
            return true;
        }
    }
    return false;
}

bool is_skipped_dir(const std::filesystem::path& path, const std::vector<std::string>& skip_dirs) {
    const std::string name = path.filename().string();
    return std::find(skip_dirs.begin(), skip_dirs.end(), name) != skip_dirs.end();
}

void consider_file(const std::filesystem::path& path, const DiscoveryOptions& options, DiscoveryResult& out) {
    if (has_skipped_extension(path, options.skip_extensions)) {
        ++out.excluded;
        return;
    }
    if (profile_for(path.extension().string()) == nullptr) {
        ++out.unsupported;
        return;
    }
    out.files.push_back(path);
}

}  // namespace

bool collect_source_files(
    const std::filesystem::path& input,
    const DiscoveryOptions& options,
    DiscoveryResult& out,
    std::string& error
) {
    out = DiscoveryResult{};

    std::error_code ec;
    if (!std::filesystem::exists(input, ec)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input, ec)) {
        consider_file(input, options, out);
    } else if (std::filesystem::is_directory(input, ec)) {
        try {
            const auto dir_options = std::filesystem::directory_options::skip_permission_denied;
            if (options.recursive) {
                auto it = std::filesystem::recursive_directory_iterator(input, dir_options);
                for (; it != std::filesystem::recursive_directory_iterator(); ++it) {
                    const auto& entry = *it;
                    if (entry.is_symlink()) {
                        // Never follow links: the rename in place would replace the link itself.
                        ++out.excluded;
                        if (entry.is_directory()) {
                            it.disable_recursion_pending();
                        }
                        continue;
                    }
                    if (entry.is_directory()) {
                        if (is_skipped_dir(entry.path(), options.skip_dirs)) {
                            it.disable_recursion_pending();
                        }
                        continue;
                    }
                    if (entry.is_regular_file()) {
                        consider_file(entry.path(), options, out);
                    }
                }
            } else {
                for (const auto& entry : std::filesystem::directory_iterator(input, dir_options)) {
                    if (!entry.is_symlink() && entry.is_regular_file()) {
                        consider_file(entry.path(), options, out);
                    }
                }
            }
        } catch (const std::filesystem::filesystem_error& ex) {
            error = "Failed to scan " + input.string() + ": " + ex.what();
            return false;
        }
    } else {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    std::sort(out.files.begin(), out.files.end());
    out.files.erase(std::unique(out.files.begin(), out.files.end()), out.files.end());

    if (out.files.empty()) {
        error = "No supported source files found under: " + input.string();
        return false;
    }

    return true;
}

}  // namespace code_mt
