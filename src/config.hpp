#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace code_mt {

inline constexpr const char* kVersion = "0.1.0";
inline constexpr const char* kConfigFileName = ".code-mt.xml";

// Effective settings: defaults < configuration file < command line.
struct Config {
    std::filesystem::path input_path = ".";
    std::filesystem::path config_file;
    std::filesystem::path report_path;

    std::string model_path = "models/qwen2.5-1.5b-instruct-q8_0.gguf";
    std::filesystem::path models_dir;
    std::string source_lang = "Chinese";
    std::string target_lang = "English";
    float temperature = 0.0f;

    bool translate_all = false;
    bool dry_run = false;
    bool recursive = true;
    bool require_foreign_text = true;
    std::size_t workers = 0;
    std::size_t max_chunk_size = 5000;
    std::uintmax_t max_file_bytes = 1024 * 1024;

    int timeout_ms = 120000;
    int max_attempts = 3;
    int backoff_ms = 500;
    int n_ctx = 4096;
    int n_threads = 8;
    int n_gpu_layers = -1;
    int max_tokens = 2048;

    std::vector<std::string> skip_dirs = {
        ".git", ".svn", ".hg", "__pycache__", "node_modules", "venv", ".venv", "dist", "build", "target"
    };
    std::vector<std::string> skip_extensions = {
        ".pyc", ".pyo", ".so", ".dll", ".exe", ".bin", ".obj", ".o", ".a",
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".svg",
        ".mp3", ".mp4", ".avi", ".mov", ".wav",
        ".zip", ".tar", ".gz", ".rar", ".7z", ".pdf", ".doc", ".docx"
    };

    bool show_progress = true;
    bool list_models = false;
};

void print_usage(const char* program_name);

// Parses the command line, loads the configuration file (explicit --config or
// the nearest .code-mt.xml above the input path) and layers the flags on top.
// `error` is "help" or "version" when those were requested.
bool parse_args(int argc, char** argv, Config& config, std::string& error);

bool is_config_key(const std::string& key);

// Applies one setting by its configuration key ("max-chunk-size", ...). The
// same keys are used by XML attributes and long command-line flags.
bool apply_setting(Config& config, const std::string& key, const std::string& value, std::string& error);

bool load_config_file(const std::filesystem::path& path, Config& config, std::string& error);

// Nearest configuration file at or above `start`; empty when there is none.
std::filesystem::path find_config_file(const std::filesystem::path& start);

// Caution printed before a run whose settings can change program behaviour;
// empty when there is nothing to warn about.
std::string risky_settings_warning(const Config& config);

}  // namespace code_mt
