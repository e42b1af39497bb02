#include "pipeline.hpp"

#include "diff.hpp"
#include "language_profile.hpp"
#include "rewriter.hpp"
#include "text.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <iterator>
#include <limits>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace code_mt {

namespace {

bool cancelled(const RunControl* control) {
    return control != nullptr && control->cancel_requested.load(std::memory_order_relaxed);
}

std::string diff_label(const std::filesystem::path& path, const std::filesystem::path& root) {
    if (!root.empty()) {
        const auto rel = path.lexically_relative(root);
        if (!rel.empty() && *rel.begin() != "..") {
            return rel.generic_string();
        }
    }
    // "a/" + "/tmp/x.c" would read "a//tmp/x.c".
    return path.relative_path().generic_string();
}

std::size_t line_number(std::string_view buffer, std::size_t offset) {
    offset = std::min(offset, buffer.size());
    return 1 + static_cast<std::size_t>(std::count(buffer.begin(), buffer.begin() + offset, '\n'));
}

// Most frequent kind among the chunk's spans; ties favour the earlier kind.
SpanKind dominant_kind(const std::vector<Span>& spans, const Chunk& chunk) {
    std::array<std::size_t, 4> counts{};
    for (const std::size_t index : chunk.span_indices) {
        ++counts[static_cast<std::size_t>(spans[index].kind)];
    }
    const auto it = std::max_element(counts.begin(), counts.end());
    return static_cast<SpanKind>(std::distance(counts.begin(), it));
}

Chunk sub_chunk(const Chunk& chunk, std::size_t begin, std::size_t end) {
    Chunk part;
    for (std::size_t k = begin; k < end; ++k) {
        part.span_indices.push_back(chunk.span_indices[k]);
        part.texts.push_back(chunk.texts[k]);
        part.char_count += count_code_points(chunk.texts[k]);
    }
    part.text = join_chunk_text(part.texts);
    return part;
}

// Per-file translation state shared by the chunk requests of one job.
struct ChunkRun {
    const FileJob& job;
    const std::vector<Span>& spans;
    const PipelineOptions& options;
    TranslationGateway& gateway;
    const std::atomic<bool>* cancel_flag;
    FileOutcome& outcome;
    std::vector<std::string>& translations;
    std::string last_failure;
};

void accept_translations(ChunkRun& run, const Chunk& chunk, const std::vector<std::string>& translated) {
    for (std::size_t k = 0; k < chunk.span_indices.size(); ++k) {
        const std::size_t index = chunk.span_indices[k];
        const Span& span = run.spans[index];
        std::string text = preserve_margins(span.raw_text, translated[k]);
        std::string reason;
        if (!fit_translation(span, *run.job.profile, text, reason)) {
            run.outcome.warnings.push_back("span at line " + std::to_string(line_number(run.job.buffer, span.start)) +
                " left untranslated (" + reason + ")");
            continue;
        }
        run.translations[index] = std::move(text);
        ++run.outcome.spans_translated;
    }
}

// A chunk whose prompt the backend cannot take is split in halves and each
// half sent on its own; a single span is never split.
void translate_chunk(ChunkRun& run, const Chunk& chunk, const std::string& label) {
    TranslationRequest request;
    request.texts = chunk.texts;
    request.source_lang = run.options.source_lang;
    request.target_lang = run.options.target_lang;
    request.kind = dominant_kind(run.spans, chunk);
    request.timeout = run.options.timeout;

    const auto result = translate_with_retry(run.gateway, request, run.options.retry, run.cancel_flag);
    if (result.ok) {
        accept_translations(run, chunk, result.translated);
        return;
    }

    const bool cancelled_now = run.cancel_flag != nullptr && run.cancel_flag->load(std::memory_order_relaxed);
    if (result.failure == GatewayErrorKind::Unsupported && chunk.span_indices.size() > 1 && !cancelled_now) {
        const std::size_t half = chunk.span_indices.size() / 2;
        ++run.outcome.chunks;
        translate_chunk(run, sub_chunk(chunk, 0, half), label + "a");
        translate_chunk(run, sub_chunk(chunk, half, chunk.span_indices.size()), label + "b");
        return;
    }

    ++run.outcome.chunks_failed;
    run.last_failure = std::string(gateway_error_kind_name(result.failure)) + ": " + result.message;
    run.outcome.warnings.push_back("chunk " + label + " left untranslated after " +
        std::to_string(result.attempts) + " attempt(s) (" + run.last_failure + ")");
}

void finish(FileJob& job, FileOutcome& outcome, FileStatus status, std::string reason = {}) {
    job.status = status;
    outcome.status = status;
    outcome.reason = std::move(reason);
}

void run_stages(
    FileJob& job,
    const PipelineOptions& options,
    TranslationGateway& gateway,
    const RunControl* control,
    FileOutcome& outcome
) {
    std::string error;

    std::error_code ec;
    const auto size = std::filesystem::file_size(job.path, ec);
    if (ec) {
        return finish(job, outcome, FileStatus::Failed, "cannot stat file: " + ec.message());
    }
    if (size > options.max_file_bytes) {
        return finish(job, outcome, FileStatus::Skipped,
            "file too large (" + std::to_string(size) + " bytes)");
    }

    if (job.profile == nullptr) {
        job.profile = profile_for(job.path.extension().string());
    }
    if (job.profile == nullptr) {
        return finish(job, outcome, FileStatus::Skipped, "unsupported language");
    }

    if (!read_file(job.path, job.buffer, error)) {
        return finish(job, outcome, FileStatus::Failed, error);
    }
    if (job.buffer.find('\0') != std::string::npos) {
        return finish(job, outcome, FileStatus::Skipped, "binary file (NUL byte)");
    }
    std::size_t bad_off = 0;
    if (!validate_utf8(job.buffer, bad_off)) {
        return finish(job, outcome, FileStatus::Skipped,
            "not valid UTF-8 at byte " + std::to_string(bad_off));
    }

    ExtractResult extracted;
    try {
        extracted = extract_spans(job.buffer, *job.profile, options.extract);
    } catch (const ExtractionError& ex) {
        return finish(job, outcome, FileStatus::Failed, std::string("extraction error: ") + ex.what());
    }
    job.status = FileStatus::Extracted;
    outcome.spans_found = extracted.spans.size();
    outcome.warnings = std::move(extracted.warnings);

    const auto selected = select_translatable(extracted.spans, options.select);
    outcome.spans_selected = selected.size();
    const auto chunks = build_chunks(extracted.spans, selected, options.max_chunk_chars);
    outcome.chunks = chunks.size();
    if (chunks.empty()) {
        return finish(job, outcome, FileStatus::Skipped, "no translatable text");
    }

    std::vector<std::string> translations;
    translations.reserve(extracted.spans.size());
    for (const auto& span : extracted.spans) {
        translations.push_back(span.raw_text);
    }

    ChunkRun run{
        job,
        extracted.spans,
        options,
        gateway,
        control != nullptr ? &control->cancel_requested : nullptr,
        outcome,
        translations,
        {},
    };
    for (std::size_t c = 0; c < chunks.size(); ++c) {
        if (cancelled(control)) {
            return finish(job, outcome, FileStatus::Skipped, "cancelled");
        }
        translate_chunk(run, chunks[c], std::to_string(c + 1) + "/" + std::to_string(chunks.size()));
    }

    // A cancel that landed during the last gateway call still abandons the file.
    if (cancelled(control)) {
        return finish(job, outcome, FileStatus::Skipped, "cancelled");
    }
    if (outcome.chunks_failed == outcome.chunks) {
        return finish(job, outcome, FileStatus::Failed,
            "all " + std::to_string(outcome.chunks) + " chunk(s) failed, last: " + run.last_failure);
    }
    job.status = FileStatus::Translated;

    RewriteResult rewritten;
    if (!rewrite_buffer(job.buffer, extracted.spans, translations, rewritten, error)) {
        return finish(job, outcome, FileStatus::Failed, "rewrite error: " + error);
    }
    if (!rewritten.edits.empty() &&
        !same_structure(extracted.spans, rewritten.buffer, *job.profile, options.extract, error)) {
        return finish(job, outcome, FileStatus::Failed, "rewrite would change code structure: " + error);
    }

    if (options.dry_run) {
        outcome.diff = make_unified_diff(
            diff_label(job.path, options.label_root), job.buffer, rewritten.buffer, rewritten.edits);
        return finish(job, outcome, FileStatus::Rewritten);
    }

    if (!rewritten.edits.empty()) {
        if (!write_file_atomic(job.path, rewritten.buffer, error)) {
            return finish(job, outcome, FileStatus::Failed, "write error: " + error);
        }
        outcome.written = true;
    }
    return finish(job, outcome, FileStatus::Rewritten);
}

}  // namespace

FileOutcome process_file(
    FileJob& job,
    const PipelineOptions& options,
    TranslationGateway& gateway,
    const RunControl* control
) {
    FileOutcome outcome;
    outcome.path = job.path;
    job.status = FileStatus::Pending;

    const auto started = std::chrono::steady_clock::now();
    try {
        run_stages(job, options, gateway, control, outcome);
    } catch (const std::exception& ex) {
        // Nothing has been written at this point: the atomic write is the last
        // stage and reports through its error string.
        finish(job, outcome, FileStatus::Failed, ex.what());
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    // The buffer is only needed while the job runs.
    job.buffer.clear();
    job.buffer.shrink_to_fit();
    return outcome;
}

bool run_worker_pool(
    const std::vector<std::filesystem::path>& files,
    const PipelineOptions& options,
    const TranslationGateway& prototype,
    std::size_t workers,
    RunControl& control,
    StatsCollector& stats,
    PoolStats& out_pool,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_pool = PoolStats{};
    out_pool.files_total = files.size();

    if (files.empty()) {
        return true;
    }

    if (workers == 0) {
        workers = 1;
    }

    const std::size_t workers_used = std::min(workers, files.size());
    out_pool.workers_used = workers_used;

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::stop_source stop_source;

    const auto started = std::chrono::steady_clock::now();

    std::jthread reporter;
    if (progress_callback) {
        reporter = std::jthread([&](std::stop_token stop_token) {
            std::size_t last_completed = std::numeric_limits<std::size_t>::max();
            while (!stop_token.stop_requested()) {
                const std::size_t done = completed.load(std::memory_order_relaxed);
                if (done != last_completed) {
                    progress_callback(done, files.size());
                    last_completed = done;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            const std::size_t final_done = completed.load(std::memory_order_relaxed);
            if (final_done != last_completed) {
                progress_callback(final_done, files.size());
            }
        });
    }

    std::vector<std::jthread> pool;
    pool.reserve(workers_used);

    auto worker_fn = [&](std::stop_token stop_token) {
        std::unique_ptr<TranslationGateway> local_gateway;
        try {
            local_gateway = prototype.clone();
        } catch (const std::exception& ex) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!failed.exchange(true, std::memory_order_relaxed)) {
                error = std::string("Failed to create gateway for worker: ") + ex.what();
            }
            stop_source.request_stop();
            return;
        }

        while (!stop_token.stop_requested() && !cancelled(&control)) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= files.size()) {
                return;
            }

            FileJob job;
            job.path = files[index];
            stats.record(process_file(job, options, *local_gateway, &control));
            completed.fetch_add(1, std::memory_order_relaxed);
        }
    };

    for (std::size_t i = 0; i < workers_used; ++i) {
        pool.emplace_back(worker_fn, stop_source.get_token());
    }

    for (auto& thread : pool) {
        thread.join();
    }

    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    out_pool.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    return !failed.load(std::memory_order_relaxed);
}

}  // namespace code_mt
