#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <pugixml.hpp>

namespace code_mt {

namespace {

const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys = {
        "model", "models-dir", "source-lang", "target-lang", "temperature",
        "translate-all", "dry-run", "recursive", "require-foreign-text",
        "workers", "max-chunk-size", "max-file-bytes",
        "timeout-ms", "max-attempts", "backoff-ms",
        "ctx", "threads", "n-gpu-layers", "max-tokens",
        "report", "progress"
    };
    return keys;
}

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    std::size_t used = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    if (used != value.size()) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    return true;
}

bool parse_size_arg(const std::string& key, const std::string& value, std::uintmax_t& out, std::string& error) {
    std::size_t used = 0;
    if (value.empty() || value[0] == '-') {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    try {
        out = static_cast<std::uintmax_t>(std::stoull(value, &used));
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    if (used != value.size()) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
    return true;
}

bool parse_float_arg(const std::string& key, const std::string& value, float& out, std::string& error) {
    std::size_t used = 0;
    try {
        out = std::stof(value, &used);
    } catch (const std::exception&) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
    if (used != value.size()) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
    return true;
}

bool parse_bool_arg(const std::string& key, std::string value, bool& out, std::string& error) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    error = "Invalid boolean for " + key + ": " + value;
    return false;
}

bool require_positive(const std::string& key, long long value, std::string& error) {
    if (value <= 0) {
        error = key + " must be positive";
        return false;
    }
    return true;
}

std::string normalize_extension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

bool load_section(const pugi::xml_node& section, Config& config, std::string& error) {
    for (const auto& attr : section.attributes()) {
        const std::string key = attr.name();
        if (!is_config_key(key)) {
            continue;
        }
        if (!apply_setting(config, key, attr.value(), error)) {
            return false;
        }
    }
    return true;
}

// Command-line flag -> configuration key, for flags taking a value.
const std::vector<std::pair<std::string, std::string>>& value_flags() {
    static const std::vector<std::pair<std::string, std::string>> flags = {
        {"-m", "model"}, {"--model", "model"},
        {"--models-dir", "models-dir"},
        {"-s", "source-lang"}, {"--source-lang", "source-lang"},
        {"-t", "target-lang"}, {"--target-lang", "target-lang"},
        {"--temperature", "temperature"},
        {"-w", "workers"}, {"--workers", "workers"},
        {"--max-chunk-size", "max-chunk-size"},
        {"--max-file-bytes", "max-file-bytes"},
        {"--timeout-ms", "timeout-ms"},
        {"--max-attempts", "max-attempts"},
        {"--backoff-ms", "backoff-ms"},
        {"--ctx", "ctx"},
        {"--threads", "threads"},
        {"--n-gpu-layers", "n-gpu-layers"},
        {"--max-tokens", "max-tokens"},
        {"--report", "report"},
    };
    return flags;
}

const std::vector<std::pair<std::string, std::pair<std::string, std::string>>>& switch_flags() {
    static const std::vector<std::pair<std::string, std::pair<std::string, std::string>>> flags = {
        {"--translate-all", {"translate-all", "true"}},
        {"-n", {"dry-run", "true"}},
        {"--dry-run", {"dry-run", "true"}},
        {"--recursive", {"recursive", "true"}},
        {"--no-recursive", {"recursive", "false"}},
        {"--all-spans", {"require-foreign-text", "false"}},
        {"--no-progress", {"progress", "false"}},
    };
    return flags;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " [path] [options]\n\n"
        << "Translates comments and docstrings of source files in place.\n\n"
        << "Options:\n"
        << "  -m, --model <gguf>        Model file (default: models/qwen2.5-1.5b-instruct-q8_0.gguf)\n"
        << "      --models-dir <dir>    Directory searched by --list-models (default: model's directory)\n"
        << "  -s, --source-lang <lang>  Source language (default: Chinese)\n"
        << "  -t, --target-lang <lang>  Target language (default: English)\n"
        << "      --translate-all       Also translate string literals (may break code)\n"
        << "  -n, --dry-run             Print a unified diff instead of writing files\n"
        << "  -w, --workers <n>         Files processed in parallel (default: hardware concurrency)\n"
        << "      --recursive           Walk subdirectories (default)\n"
        << "      --no-recursive        Only process the top level of the directory\n"
        << "  -c, --config <file>       Configuration file (default: nearest " << kConfigFileName << ")\n"
        << "      --max-chunk-size <n>  Characters per gateway request (default: 5000)\n"
        << "      --max-file-bytes <n>  Skip larger files (default: 1048576)\n"
        << "      --all-spans           Translate spans without foreign-script text too\n"
        << "      --timeout-ms <n>      Per-request timeout (default: 120000)\n"
        << "      --max-attempts <n>    Attempts for transient gateway failures (default: 3)\n"
        << "      --backoff-ms <n>      First retry delay, doubled per attempt (default: 500)\n"
        << "      --ctx <n>             Context size (default: 4096)\n"
        << "      --threads <n>         llama.cpp CPU threads per context (default: 8)\n"
        << "      --n-gpu-layers <n>    llama.cpp GPU layers (default: -1)\n"
        << "      --max-tokens <n>      Max generated tokens per request (default: 2048)\n"
        << "      --temperature <t>     Sampling temperature, 0 for greedy (default: 0)\n"
        << "      --report <file.xml>   Write an XML run report\n"
        << "      --no-progress         Disable progress bar output\n"
        << "      --list-models         List available models and exit\n"
        << "      --version             Print version\n"
        << "  -h, --help                Show this help\n";
}

bool is_config_key(const std::string& key) {
    const auto& keys = config_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

bool apply_setting(Config& config, const std::string& key, const std::string& value, std::string& error) {
    int n = 0;
    std::uintmax_t size = 0;

    if (key == "model") {
        config.model_path = value;
    } else if (key == "models-dir") {
        config.models_dir = value;
    } else if (key == "source-lang") {
        config.source_lang = value;
    } else if (key == "target-lang") {
        config.target_lang = value;
    } else if (key == "temperature") {
        return parse_float_arg(key, value, config.temperature, error);
    } else if (key == "translate-all") {
        return parse_bool_arg(key, value, config.translate_all, error);
    } else if (key == "dry-run") {
        return parse_bool_arg(key, value, config.dry_run, error);
    } else if (key == "recursive") {
        return parse_bool_arg(key, value, config.recursive, error);
    } else if (key == "require-foreign-text") {
        return parse_bool_arg(key, value, config.require_foreign_text, error);
    } else if (key == "progress") {
        return parse_bool_arg(key, value, config.show_progress, error);
    } else if (key == "workers") {
        if (!parse_size_arg(key, value, size, error)) {
            return false;
        }
        config.workers = static_cast<std::size_t>(size);
    } else if (key == "max-chunk-size") {
        if (!parse_size_arg(key, value, size, error) || !require_positive(key, static_cast<long long>(size), error)) {
            return false;
        }
        config.max_chunk_size = static_cast<std::size_t>(size);
    } else if (key == "max-file-bytes") {
        if (!parse_size_arg(key, value, size, error) || !require_positive(key, static_cast<long long>(size), error)) {
            return false;
        }
        config.max_file_bytes = size;
    } else if (key == "timeout-ms") {
        if (!parse_int_arg(key, value, config.timeout_ms, error)) {
            return false;
        }
    } else if (key == "max-attempts") {
        if (!parse_int_arg(key, value, n, error) || !require_positive(key, n, error)) {
            return false;
        }
        config.max_attempts = n;
    } else if (key == "backoff-ms") {
        if (!parse_int_arg(key, value, n, error)) {
            return false;
        }
        config.backoff_ms = std::max(0, n);
    } else if (key == "ctx") {
        return parse_int_arg(key, value, config.n_ctx, error);
    } else if (key == "threads") {
        return parse_int_arg(key, value, config.n_threads, error);
    } else if (key == "n-gpu-layers") {
        return parse_int_arg(key, value, config.n_gpu_layers, error);
    } else if (key == "max-tokens") {
        return parse_int_arg(key, value, config.max_tokens, error);
    } else if (key == "report") {
        config.report_path = value;
    } else {
        error = "Unknown setting: " + key;
        return false;
    }
    return true;
}

bool load_config_file(const std::filesystem::path& path, Config& config, std::string& error) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_file(path.c_str(), pugi::parse_default);
    if (!parse) {
        error = "Failed to parse config " + path.string() + ": " + parse.description();
        return false;
    }

    const pugi::xml_node root = doc.child("code-mt");
    if (!root) {
        error = "Config " + path.string() + " has no <code-mt> root element";
        return false;
    }

    for (const char* section : {"translation", "processing", "gateway", "output"}) {
        if (!load_section(root.child(section), config, error)) {
            error = path.string() + ": " + error;
            return false;
        }
    }

    if (const pugi::xml_node filters = root.child("filters")) {
        if (filters.attribute("replace-defaults").as_bool(false)) {
            config.skip_dirs.clear();
            config.skip_extensions.clear();
        }
        for (const auto& dir : filters.children("skip-dir")) {
            const std::string name = dir.text().as_string();
            if (!name.empty() && std::find(config.skip_dirs.begin(), config.skip_dirs.end(), name) == config.skip_dirs.end()) {
                config.skip_dirs.push_back(name);
            }
        }
        for (const auto& ext : filters.children("skip-extension")) {
            const std::string name = normalize_extension(ext.text().as_string());
            if (name.size() > 1 &&
                std::find(config.skip_extensions.begin(), config.skip_extensions.end(), name) == config.skip_extensions.end()) {
                config.skip_extensions.push_back(name);
            }
        }
    }

    config.config_file = path;
    return true;
}

std::filesystem::path find_config_file(const std::filesystem::path& start) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::weakly_canonical(start, ec);
    if (ec) {
        dir = std::filesystem::absolute(start, ec);
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        dir = dir.parent_path();
    }

    while (!dir.empty()) {
        const auto candidate = dir / kConfigFileName;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (dir == dir.parent_path()) {
            break;
        }
        dir = dir.parent_path();
    }
    return {};
}

bool parse_args(int argc, char** argv, Config& config, std::string& error) {
    std::vector<std::pair<std::string, std::string>> settings;
    std::filesystem::path explicit_config;
    bool have_path = false;
    error.clear();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }
        if (arg == "--version") {
            error = "version";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "-c" || arg == "--config") {
            explicit_config = require_value(arg);
        } else if (arg == "--list-models") {
            config.list_models = true;
        } else if (const auto v = std::find_if(value_flags().begin(), value_flags().end(),
                       [&](const auto& flag) { return flag.first == arg; });
                   v != value_flags().end()) {
            std::string value = require_value(arg);
            settings.emplace_back(v->second, std::move(value));
        } else if (const auto s = std::find_if(switch_flags().begin(), switch_flags().end(),
                       [&](const auto& flag) { return flag.first == arg; });
                   s != switch_flags().end()) {
            settings.push_back(s->second);
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else if (!have_path) {
            config.input_path = arg;
            have_path = true;
        } else {
            error = "Unexpected extra path: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (!explicit_config.empty()) {
        if (!std::filesystem::is_regular_file(explicit_config)) {
            error = "Config file does not exist: " + explicit_config.string();
            return false;
        }
        if (!load_config_file(explicit_config, config, error)) {
            return false;
        }
    } else if (const auto found = find_config_file(config.input_path); !found.empty()) {
        if (!load_config_file(found, config, error)) {
            return false;
        }
    }

    for (const auto& [key, value] : settings) {
        if (!apply_setting(config, key, value, error)) {
            return false;
        }
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.models_dir.empty()) {
        config.models_dir = std::filesystem::path(config.model_path).parent_path();
        if (config.models_dir.empty()) {
            config.models_dir = ".";
        }
    }

    if (!config.list_models && (config.source_lang.empty() || config.target_lang.empty())) {
        error = "--source-lang and --target-lang must not be empty";
        return false;
    }

    return true;
}

std::string risky_settings_warning(const Config& config) {
    if (!config.translate_all) {
        return {};
    }
    std::string warning = "--translate-all rewrites string literals; tests and runtime behaviour may change";
    if (!config.dry_run) {
        warning += " (files are written in place, consider --dry-run first)";
    }
    return warning;
}

}  // namespace code_mt
