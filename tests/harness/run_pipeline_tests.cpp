#include "diff.hpp"
#include "discovery.hpp"
#include "fake_gateway.hpp"
#include "pipeline.hpp"
#include "stats.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool write_text_(const std::filesystem::path& path, const std::string& text) {
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) return false;
        ofs << text;
        return ofs.good();
    }

    static std::string read_text_(const std::filesystem::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }

    static std::filesystem::path fresh_dir_(const std::string& name) {
        std::error_code ec{};
        const auto root = std::filesystem::temp_directory_path(ec) / name;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root, ec);
        return root;
    }

    static std::filesystem::path fixture_(
        const std::filesystem::path& root,
        const std::string& name,
        const std::string& text
    ) {
        const auto path = root / name;
        write_text_(path, text);
        return path;
    }

    static code_mt::PipelineOptions options_() {
        code_mt::PipelineOptions options;
        options.source_lang = "Chinese";
        options.target_lang = "English";
        options.retry.max_attempts = 2;
        options.retry.backoff = std::chrono::milliseconds(1);
        options.timeout = std::chrono::milliseconds(1000);
        return options;
    }

    struct Run {
        bool ok = false;
        code_mt::RunStats totals;
        std::vector<code_mt::FileOutcome> outcomes;
        code_mt::PoolStats pool;
    };

    static Run run_pool_(
        const std::vector<std::filesystem::path>& files,
        const code_mt::PipelineOptions& options,
        const code_mt::TranslationGateway& gateway,
        code_mt::RunControl& control,
        std::size_t workers = 3
    ) {
        code_mt::StatsCollector stats;
        std::string error;
        Run run;
        run.ok = code_mt::run_worker_pool(files, options, gateway, workers, control, stats, run.pool, error);
        run.totals = stats.snapshot();
        run.outcomes = stats.outcomes();
        return run;
    }

    static const code_mt::FileOutcome* outcome_for_(const Run& run, const std::filesystem::path& path) {
        for (const auto& outcome : run.outcomes) {
            if (outcome.path == path) return &outcome;
        }
        return nullptr;
    }

    static bool test_identity_gateway_is_a_no_op_() {
        const auto root = fresh_dir_("code-mt-pipeline-identity");
        std::map<std::filesystem::path, std::string> originals = {
            {root / "a.py", "# 注释\ndef f():\n    \"\"\"文档\"\"\"\n    return \"字符串\"\n"},
            {root / "b.rs", "/// 文档\nfn main() { /* 块 /* 嵌套 */ */ }\n"},
            {root / "c.js", "// 注释\nconst s = `模板`;\n"},
            {root / "d.cpp", "/** 文档 */\nint main() { return 0; } // 尾\n"},
        };
        std::vector<std::filesystem::path> files;
        for (const auto& [path, text] : originals) {
            write_text_(path, text);
            files.push_back(path);
        }

        auto options = options_();
        options.extract.translate_all = true;
        const auto gateway = code_mt_test::identity_gateway();
        code_mt::RunControl control;
        const auto run = run_pool_(files, options, gateway, control);

        bool ok = true;
        ok &= require_(run.ok, "pool runs");
        ok &= require_(run.totals.processed == 4 && run.totals.translated == 4 && run.totals.failed == 0,
                       "every file goes through the full pipeline");
        ok &= require_(gateway.calls() >= 4, "the gateway was consulted");
        for (const auto& [path, text] : originals) {
            ok &= require_(read_text_(path) == text, "identity translation leaves bytes unchanged");
        }
        for (const auto& outcome : run.outcomes) {
            ok &= require_(outcome.status == code_mt::FileStatus::Rewritten && !outcome.written,
                           "unchanged output is not written");
        }
        return ok;
    }

    static bool test_partial_failure_isolation_() {
        const auto root = fresh_dir_("code-mt-pipeline-isolation");
        const auto good_py = fixture_(root, "a.py", "# 注释\nx = 1\n");
        const auto good_c = fixture_(root, "b.c", "int x; /* 说明 */\n");
        const std::string broken_text = "fn main() {}\n*/ // 注释\n";
        const auto broken = fixture_(root, "c.rs", broken_text);

        const auto gateway = code_mt_test::tagging_gateway();
        code_mt::RunControl control;
        const auto run = run_pool_({good_py, good_c, broken}, options_(), gateway, control);

        bool ok = true;
        ok &= require_(run.totals.processed == 3, "all three files processed");
        ok &= require_(run.totals.translated == 2 && run.totals.failed == 1, "two successes, one failure");
        ok &= require_(read_text_(broken) == broken_text, "failed file untouched on disk");
        ok &= require_(read_text_(good_py) == "# EN: 注释\nx = 1\n", "python comment rewritten");
        ok &= require_(read_text_(good_c) == "int x; /* EN: 说明 */\n", "c comment rewritten");

        const auto* failed = outcome_for_(run, broken);
        ok &= require_(failed != nullptr && failed->status == code_mt::FileStatus::Failed &&
                       failed->reason.find("extraction error") != std::string::npos,
                       "failure carries the extraction error");
        return ok;
    }

    static bool test_no_spans_means_no_gateway_call_() {
        const auto root = fresh_dir_("code-mt-pipeline-empty");
        const auto english = fixture_(root, "e.py", "# plain english\nprint(1)\n");
        const auto bare = fixture_(root, "f.go", "package main\n\nfunc main() {}\n");

        const auto gateway = code_mt_test::tagging_gateway();
        code_mt::RunControl control;
        const auto run = run_pool_({english, bare}, options_(), gateway, control);

        bool ok = true;
        ok &= require_(run.totals.skipped == 2 && run.totals.failed == 0, "both files skipped");
        ok &= require_(gateway.calls() == 0, "no gateway call for files without translatable text");
        const auto* outcome = outcome_for_(run, english);
        ok &= require_(outcome != nullptr && outcome->spans_found == 1 && outcome->spans_selected == 0,
                       "english comment found but not selected");
        return ok;
    }

    static bool test_chunk_failure_degrades_to_untranslated_() {
        const auto root = fresh_dir_("code-mt-pipeline-degrade");
        const auto file = fixture_(root, "m.py", "# 好\nx = 1\n# 坏\n");

        code_mt_test::FakeGateway gateway([](const code_mt::TranslationRequest& request) {
            for (const auto& text : request.texts) {
                if (text.find("坏") != std::string::npos) {
                    throw code_mt::GatewayError(code_mt::GatewayErrorKind::Protocol, "separator lost");
                }
            }
            std::vector<std::string> out;
            for (const auto& text : request.texts) out.push_back("EN:" + text);
            return out;
        });

        auto options = options_();
        options.max_chunk_chars = 1;

        code_mt::FileJob job;
        job.path = file;
        const auto outcome = code_mt::process_file(job, options, gateway);

        bool ok = true;
        ok &= require_(outcome.status == code_mt::FileStatus::Rewritten, "file still rewritten");
        ok &= require_(outcome.chunks == 2 && outcome.chunks_failed == 1, "one of two chunks failed");
        ok &= require_(outcome.spans_translated == 1, "one span translated");
        ok &= require_(outcome.warnings.size() == 1 && outcome.warnings[0].find("protocol") != std::string::npos,
                       "failed chunk reported as warning");
        ok &= require_(read_text_(file) == "# EN: 好\nx = 1\n# 坏\n", "failed span left untranslated");
        ok &= require_(job.status == code_mt::FileStatus::Rewritten, "job status follows outcome");
        return ok;
    }

    static bool test_all_chunks_failed_marks_file_failed_() {
        const auto root = fresh_dir_("code-mt-pipeline-allfail");
        const std::string text = "// 注释\nint x;\n";
        const auto file = fixture_(root, "x.c", text);

        code_mt_test::FakeGateway gateway([](const code_mt::TranslationRequest&) -> std::vector<std::string> {
            throw code_mt::GatewayError(code_mt::GatewayErrorKind::Unavailable, "connection refused");
        });

        code_mt::FileJob job;
        job.path = file;
        const auto outcome = code_mt::process_file(job, options_(), gateway);

        bool ok = true;
        ok &= require_(outcome.status == code_mt::FileStatus::Failed, "file failed");
        ok &= require_(gateway.calls() == 2, "transient failure retried up to max_attempts");
        ok &= require_(read_text_(file) == text, "file untouched");
        ok &= require_(outcome.reason.find("connection refused") != std::string::npos, "reason names the cause");
        return ok;
    }

    static bool test_dry_run_matches_real_run_() {
        const auto root = fresh_dir_("code-mt-pipeline-dryrun");
        const std::string text = "package main\n// 注释\nfunc main() {}\n/* 说明\n   第二行 */\n";
        const auto file = fixture_(root, "d.go", text);
        const auto gateway = code_mt_test::tagging_gateway();

        auto options = options_();
        options.dry_run = true;
        options.label_root = root;

        code_mt::FileJob dry_job;
        dry_job.path = file;
        auto gw = gateway.clone();
        const auto dry = code_mt::process_file(dry_job, options, *gw);

        bool ok = true;
        ok &= require_(dry.status == code_mt::FileStatus::Rewritten && !dry.written, "dry run reports, never writes");
        ok &= require_(read_text_(file) == text, "dry run leaves the file untouched");
        ok &= require_(dry.diff.starts_with("--- a/d.go\n"), "diff labelled relative to the input root");

        std::string applied;
        std::string error;
        ok &= require_(code_mt::apply_unified_diff(text, dry.diff, applied, error), "dry-run diff applies");

        options.dry_run = false;
        code_mt::FileJob real_job;
        real_job.path = file;
        const auto real = code_mt::process_file(real_job, options, *gw);
        ok &= require_(real.status == code_mt::FileStatus::Rewritten && real.written, "real run writes");
        ok &= require_(read_text_(file) == applied, "dry-run diff equals the real rewrite");
        return ok;
    }

    static bool test_cancellation_() {
        const auto root = fresh_dir_("code-mt-pipeline-cancel");
        const std::string text = "# 一\nx = 1\n# 二\ny = 2\n# 三\n";
        const auto file = fixture_(root, "c.py", text);

        bool ok = true;

        // Cancelled before the run: nothing is dispatched.
        {
            const auto gateway = code_mt_test::tagging_gateway();
            code_mt::RunControl control;
            control.cancel_requested.store(true);
            const auto run = run_pool_({file}, options_(), gateway, control);
            ok &= require_(run.totals.processed == 0 && gateway.calls() == 0, "no job starts after cancellation");
        }

        // Cancelled while the file is in flight: abandoned without a write.
        {
            code_mt::RunControl control;
            code_mt_test::FakeGateway gateway([&control](const code_mt::TranslationRequest& request) {
                control.cancel_requested.store(true);
                std::vector<std::string> out;
                for (const auto& t : request.texts) out.push_back("EN:" + t);
                return out;
            });
            auto options = options_();
            options.max_chunk_chars = 1;

            code_mt::FileJob job;
            job.path = file;
            const auto outcome = code_mt::process_file(job, options, gateway, &control);
            ok &= require_(outcome.status == code_mt::FileStatus::Skipped && outcome.reason == "cancelled",
                           "in-flight job is abandoned");
            ok &= require_(gateway.calls() == 1, "no further chunk sent after cancellation");
            ok &= require_(read_text_(file) == text, "abandoned file is not half-written");
        }
        return ok;
    }

    static bool test_undecodable_and_oversized_files_are_skipped_() {
        const auto root = fresh_dir_("code-mt-pipeline-decode");
        const auto invalid = fixture_(root, "bad.c", std::string("// \xff\xfe 注释\n"));
        const auto binary = fixture_(root, "nul.c", std::string("// 注释\n\0\0", 12));
        const auto large = fixture_(root, "big.c", "// 注释 " + std::string(200, 'x') + "\n");

        const auto gateway = code_mt_test::tagging_gateway();
        auto options = options_();
        options.max_file_bytes = 100;

        bool ok = true;
        for (const auto& path : {invalid, binary, large}) {
            code_mt::FileJob job;
            job.path = path;
            auto gw = gateway.clone();
            const auto outcome = code_mt::process_file(job, options, *gw);
            ok &= require_(outcome.status == code_mt::FileStatus::Skipped, "file skipped, not failed");
        }
        ok &= require_(gateway.calls() == 0, "skipped files never reach the gateway");

        code_mt::FileJob job;
        job.path = invalid;
        auto gw = gateway.clone();
        ok &= require_(code_mt::process_file(job, options, *gw).reason.find("UTF-8") != std::string::npos,
                       "decode error names the encoding");
        return ok;
    }

    static bool test_discovery_feeds_the_pool_() {
        const auto root = fresh_dir_("code-mt-pipeline-discovery");
        std::error_code ec{};
        std::filesystem::create_directories(root / "src" / "deep", ec);
        std::filesystem::create_directories(root / "node_modules", ec);
        fixture_(root / "src", "a.py", "# 注释\n");
        fixture_(root / "src" / "deep", "b.rs", "// 注释\n");
        fixture_(root / "node_modules", "c.js", "// 注释\n");
        fixture_(root, "d.min.js", "// 注释\n");
        fixture_(root, "notes.txt", "注释\n");

        code_mt::DiscoveryOptions discovery;
        discovery.skip_dirs = {"node_modules"};
        discovery.skip_extensions = {".min.js"};

        code_mt::DiscoveryResult found;
        std::string error;
        bool ok = true;
        ok &= require_(code_mt::collect_source_files(root, discovery, found, error), "discovery succeeds");
        ok &= require_(found.files.size() == 2, "skip lists and unsupported files filtered");
        ok &= require_(found.files.size() == 2 && found.files[0] == root / "src" / "a.py" &&
                       found.files[1] == root / "src" / "deep" / "b.rs",
                       "paths sorted");
        ok &= require_(found.unsupported == 1 && found.excluded == 1, "filtered files counted");

        discovery.recursive = false;
        ok &= require_(!code_mt::collect_source_files(root, discovery, found, error),
                       "top level alone has no supported file");

        std::vector<std::string> seen;
        code_mt::StatsCollector stats([&seen](const code_mt::FileOutcome& outcome, const code_mt::RunStats& totals) {
            seen.push_back(outcome.path.filename().string() + ":" + std::to_string(totals.processed));
        });
        discovery.recursive = true;
        ok &= require_(code_mt::collect_source_files(root, discovery, found, error), "discovery again");

        const auto gateway = code_mt_test::tagging_gateway();
        code_mt::RunControl control;
        code_mt::PoolStats pool;
        ok &= require_(code_mt::run_worker_pool(found.files, options_(), gateway, 8, control, stats, pool, error),
                       "pool runs");
        ok &= require_(pool.workers_used == 2, "workers capped by job count");
        ok &= require_(seen.size() == 2, "sink sees every outcome");
        ok &= require_(stats.snapshot().translated == 2, "both files translated");
        ok &= require_(read_text_(root / "node_modules" / "c.js") == "// 注释\n", "skipped directory untouched");
        return ok;
    }

    // Replies from a table keyed by the trimmed source text; unknown texts echo.
    static code_mt_test::FakeGateway table_gateway_(std::map<std::string, std::string> replies) {
        return code_mt_test::FakeGateway([replies](const code_mt::TranslationRequest& request) {
            std::vector<std::string> out;
            for (const auto& text : request.texts) {
                const auto first = text.find_first_not_of(" \n");
                const auto last = text.find_last_not_of(" \n");
                const std::string key = first == std::string::npos ? "" : text.substr(first, last - first + 1);
                const auto it = replies.find(key);
                out.push_back(it == replies.end() ? text : it->second);
            }
            return out;
        });
    }

    static bool test_translations_cannot_break_out_of_their_construct_() {
        const auto root = fresh_dir_("code-mt-pipeline-contained");
        const auto line = fixture_(root, "line.c", "int x; // 中文注释\nint y;\n");
        const auto block = fixture_(root, "block.c", "/* 中文 */ int x;\n// 其他\n");
        const auto text = fixture_(root, "text.py", "s = \"你好\"\n");

        auto gateway = table_gateway_({
            {"中文注释", "Chinese\ncomment"},
            {"中文", "uses */ marker"},
            {"其他", "other"},
            {"你好", "say \"hi\""},
        });

        bool ok = true;
        code_mt::FileJob job;
        job.path = line;
        auto outcome = code_mt::process_file(job, options_(), gateway);
        ok &= require_(outcome.status == code_mt::FileStatus::Rewritten, "line comment file rewritten");
        ok &= require_(read_text_(line) == "int x; // Chinese comment\nint y;\n",
                       "newline in a line comment translation folded into a space");

        job = code_mt::FileJob{};
        job.path = block;
        outcome = code_mt::process_file(job, options_(), gateway);
        ok &= require_(outcome.status == code_mt::FileStatus::Rewritten, "block comment file rewritten");
        ok &= require_(read_text_(block) == "/* 中文 */ int x;\n// other\n",
                       "translation containing the closer is refused, the rest still applies");
        ok &= require_(outcome.spans_translated == 1, "refused span not counted as translated");
        bool warned = false;
        for (const auto& warning : outcome.warnings) {
            warned |= warning.find("line 1 left untranslated") != std::string::npos;
        }
        ok &= require_(warned, "refused span reported with its line");

        auto options = options_();
        options.extract.translate_all = true;
        job = code_mt::FileJob{};
        job.path = text;
        outcome = code_mt::process_file(job, options, gateway);
        ok &= require_(outcome.status == code_mt::FileStatus::Rewritten, "string literal file rewritten");
        ok &= require_(read_text_(text) == "s = \"say \\\"hi\\\"\"\n", "quotes inside a translated string are escaped");
        return ok;
    }

    static bool test_oversized_prompt_is_split_() {
        const auto root = fresh_dir_("code-mt-pipeline-split");
        const auto file = fixture_(root, "big.py", "# 一\n# 二\n# 三\n# 四\n");

        // Only single-span requests fit the backend.
        code_mt_test::FakeGateway gateway([](const code_mt::TranslationRequest& request) {
            if (request.texts.size() > 1) {
                throw code_mt::GatewayError(code_mt::GatewayErrorKind::Unsupported, "Prompt too long");
            }
            return std::vector<std::string>{"EN:" + request.texts[0]};
        });

        code_mt::FileJob job;
        job.path = file;
        const auto outcome = code_mt::process_file(job, options_(), gateway);

        bool ok = true;
        ok &= require_(outcome.status == code_mt::FileStatus::Rewritten, "file rewritten");
        ok &= require_(outcome.chunks_failed == 0 && outcome.spans_translated == 4, "every span translated");
        ok &= require_(outcome.chunks == 4, "one chunk of four became four requests");
        ok &= require_(gateway.calls() == 7, "4 + 2 + 1 requests: each refusal is final, never retried");
        ok &= require_(read_text_(file) == "# EN: 一\n# EN: 二\n# EN: 三\n# EN: 四\n", "all spans written");
        return ok;
    }

    static bool test_single_file_diff_label_() {
        const auto root = fresh_dir_("code-mt-pipeline-label");
        const auto file = fixture_(root, "one.rs", "// 注释\n");

        auto options = options_();
        options.dry_run = true;
        auto gateway = code_mt_test::tagging_gateway();

        code_mt::FileJob job;
        job.path = file;
        auto outcome = code_mt::process_file(job, options, gateway);
        bool ok = true;
        ok &= require_(outcome.diff.starts_with("--- a/") && outcome.diff.find("--- a//") == std::string::npos,
                       "absolute path without a root loses its leading slash");

        options.label_root = file.parent_path();
        job = code_mt::FileJob{};
        job.path = file;
        outcome = code_mt::process_file(job, options, gateway);
        ok &= require_(outcome.diff.starts_with("--- a/one.rs\n+++ b/one.rs\n"), "file input labelled by its name");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"identity_gateway_is_a_no_op", test_identity_gateway_is_a_no_op_},
        {"partial_failure_isolation", test_partial_failure_isolation_},
        {"no_spans_means_no_gateway_call", test_no_spans_means_no_gateway_call_},
        {"chunk_failure_degrades_to_untranslated", test_chunk_failure_degrades_to_untranslated_},
        {"all_chunks_failed_marks_file_failed", test_all_chunks_failed_marks_file_failed_},
        {"dry_run_matches_real_run", test_dry_run_matches_real_run_},
        {"cancellation", test_cancellation_},
        {"undecodable_and_oversized_files_are_skipped", test_undecodable_and_oversized_files_are_skipped_},
        {"discovery_feeds_the_pool", test_discovery_feeds_the_pool_},
        {"translations_cannot_break_out_of_their_construct", test_translations_cannot_break_out_of_their_construct_},
        {"oversized_prompt_is_split", test_oversized_prompt_is_split_},
        {"single_file_diff_label", test_single_file_diff_label_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
