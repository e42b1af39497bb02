#include "config.hpp"
#include "discovery.hpp"
#include "gateway_llama.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "stats.hpp"

#include <algorithm>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

code_mt::RunControl g_control;

extern "C" void handle_interrupt(int) {
    g_control.cancel_requested.store(true);
    // A second Ctrl-C terminates immediately.
    std::signal(SIGINT, SIG_DFL);
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(std::size_t done_files, std::size_t total_files, const code_mt::RunStats& stats, bool done) {
    if (total_files == 0) {
        return;
    }

    const double fraction = static_cast<double>(done_files) / static_cast<double>(total_files);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "files " << done_files << "/" << total_files
        << " spans " << stats.spans_translated
        << " failed " << stats.failed;

    std::cerr << line.str();
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

std::string display_path(const std::filesystem::path& path, const std::filesystem::path& root) {
    if (std::filesystem::is_directory(root)) {
        const auto rel = path.lexically_relative(root);
        if (!rel.empty()) {
            return rel.generic_string();
        }
    }
    return path.generic_string();
}

int list_models(const code_mt::Config& config) {
    const auto models = code_mt::LlamaGateway::list_models(config.models_dir);
    if (models.empty()) {
        std::cerr << "[model] no *.gguf files in " << config.models_dir.string() << "\n";
        return 0;
    }
    std::cout << "Models in " << config.models_dir.string() << ":\n";
    for (const auto& model : models) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(model, ec);
        std::cout << "  " << model.filename().string();
        if (!ec) {
            std::cout << "  (" << (size / (1024 * 1024)) << " MiB)";
        }
        std::cout << "\n";
    }
    return 0;
}

code_mt::PipelineOptions pipeline_options_from(const code_mt::Config& config) {
    code_mt::PipelineOptions options;
    options.extract.translate_all = config.translate_all;
    options.select.require_foreign_text = config.require_foreign_text;
    options.max_chunk_chars = config.max_chunk_size;
    options.source_lang = config.source_lang;
    options.target_lang = config.target_lang;
    options.retry.max_attempts = config.max_attempts;
    options.retry.backoff = std::chrono::milliseconds(config.backoff_ms);
    options.timeout = std::chrono::milliseconds(config.timeout_ms);
    options.dry_run = config.dry_run;
    options.max_file_bytes = config.max_file_bytes;
    options.label_root = std::filesystem::is_directory(config.input_path)
        ? config.input_path
        : config.input_path.parent_path();
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    code_mt::Config config;
    std::string error;

    if (!code_mt::parse_args(argc, argv, config, error)) {
        if (error == "version") {
            std::cout << "code-mt " << code_mt::kVersion << "\n";
            return 0;
        }
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        code_mt::print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    if (config.list_models) {
        return list_models(config);
    }

    code_mt::DiscoveryOptions discovery;
    discovery.recursive = config.recursive;
    discovery.skip_dirs = config.skip_dirs;
    discovery.skip_extensions = config.skip_extensions;

    code_mt::DiscoveryResult found;
    if (!code_mt::collect_source_files(config.input_path, discovery, found, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    if (!config.config_file.empty()) {
        std::cerr << "[config] " << config.config_file.string() << "\n";
    }
    std::cerr
        << "[scan] files=" << found.files.size()
        << " unsupported=" << found.unsupported
        << " excluded=" << found.excluded
        << "\n";

    if (const auto warning = code_mt::risky_settings_warning(config); !warning.empty()) {
        std::cerr << "[warn] " << warning << "\n";
    }

    code_mt::LlamaGatewayConfig gateway_cfg;
    gateway_cfg.model_path = config.model_path;
    gateway_cfg.n_ctx = config.n_ctx;
    gateway_cfg.n_gpu_layers = config.n_gpu_layers;
    gateway_cfg.n_threads = config.n_threads;
    gateway_cfg.max_tokens = config.max_tokens;
    gateway_cfg.temperature = config.temperature;

    std::unique_ptr<code_mt::LlamaGateway> gateway;
    try {
        gateway = std::make_unique<code_mt::LlamaGateway>(gateway_cfg);
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] failed to initialize gateway: " << ex.what() << "\n";
        return 1;
    }
    std::cerr << "[model] " << config.model_path << "\n";

    std::mutex console_mutex;
    const auto& root = config.input_path;
    const bool show_progress = config.show_progress;

    auto sink = [&](const code_mt::FileOutcome& outcome, const code_mt::RunStats&) {
        std::lock_guard<std::mutex> lock(console_mutex);
        if (show_progress) {
            std::cerr << "\r\33[2K";
        }
        const std::string name = display_path(outcome.path, root);
        for (const auto& warning : outcome.warnings) {
            std::cerr << "[warn] " << name << ": " << warning << "\n";
        }
        switch (outcome.status) {
        case code_mt::FileStatus::Rewritten:
            if (config.dry_run) {
                std::cout << outcome.diff;
                std::cout
                    << "[dry-run] " << name
                    << " spans=" << outcome.spans_translated << "/" << outcome.spans_found
                    << " chunks=" << outcome.chunks
                    << " chunks_failed=" << outcome.chunks_failed
                    << " time_ms=" << outcome.elapsed.count()
                    << "\n";
            } else {
                std::cout
                    << "[ok] " << name
                    << " spans=" << outcome.spans_translated << "/" << outcome.spans_found
                    << " chunks=" << outcome.chunks
                    << " chunks_failed=" << outcome.chunks_failed
                    << (outcome.written ? "" : " unchanged")
                    << " time_ms=" << outcome.elapsed.count()
                    << "\n";
            }
            break;
        case code_mt::FileStatus::Failed:
            std::cerr << "[error] " << name << ": " << outcome.reason << "\n";
            break;
        default:
            std::cout << "[skip] " << name << " " << outcome.reason << "\n";
            break;
        }
        std::cout.flush();
    };

    code_mt::StatsCollector stats(sink);

    auto progress_callback = [&](std::size_t done_files, std::size_t total_files) {
        if (!show_progress) {
            return;
        }
        const auto snapshot = stats.snapshot();
        std::lock_guard<std::mutex> lock(console_mutex);
        print_progress(done_files, total_files, snapshot, false);
    };

    std::signal(SIGINT, handle_interrupt);

    const auto options = pipeline_options_from(config);
    code_mt::PoolStats pool;
    const bool pool_ok = code_mt::run_worker_pool(
        found.files,
        options,
        *gateway,
        config.workers,
        g_control,
        stats,
        pool,
        error,
        progress_callback
    );

    std::signal(SIGINT, SIG_DFL);
    const bool interrupted = g_control.cancel_requested.load();
    const auto totals = stats.snapshot();

    if (show_progress) {
        print_progress(totals.processed, found.files.size(), totals, true);
    }
    if (!pool_ok) {
        std::cerr << "[error] " << error << "\n";
    }
    if (interrupted) {
        std::cerr << "[warn] interrupted, " << (found.files.size() - totals.processed) << " file(s) not processed\n";
    }

    std::cout
        << "[summary] files=" << found.files.size()
        << " processed=" << totals.processed
        << " translated=" << totals.translated
        << " skipped=" << totals.skipped
        << " failed=" << totals.failed
        << " spans_translated=" << totals.spans_translated
        << " chunks_failed=" << totals.chunks_failed
        << " warnings=" << totals.warnings
        << " workers=" << pool.workers_used
        << " time_ms=" << pool.wall_time.count()
        << "\n";

    if (!config.report_path.empty()) {
        if (!code_mt::write_run_report(
                config.report_path, config, stats.outcomes(), totals, pool, interrupted, error
            )) {
            std::cerr << "[error] " << error << "\n";
            return 1;
        }
    }

    if (interrupted) {
        return 130;
    }
    return (!pool_ok || totals.failed > 0) ? 1 : 0;
}
