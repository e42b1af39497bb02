#include "report.hpp"

#include "span.hpp"

#include <pugixml.hpp>

namespace code_mt {

namespace {

void add_settings(pugi::xml_node parent, const Config& config) {
    pugi::xml_node settings = parent.append_child("settings");
    settings.append_attribute("input") = config.input_path.generic_string().c_str();
    settings.append_attribute("model") = config.model_path.c_str();
    settings.append_attribute("source-lang") = config.source_lang.c_str();
    settings.append_attribute("target-lang") = config.target_lang.c_str();
    settings.append_attribute("translate-all") = config.translate_all;
    settings.append_attribute("dry-run") = config.dry_run;
    settings.append_attribute("require-foreign-text") = config.require_foreign_text;
    settings.append_attribute("workers") = static_cast<unsigned long long>(config.workers);
    settings.append_attribute("max-chunk-size") = static_cast<unsigned long long>(config.max_chunk_size);
    if (!config.config_file.empty()) {
        settings.append_attribute("config") = config.config_file.generic_string().c_str();
    }
}

void add_outcome(pugi::xml_node parent, const FileOutcome& outcome) {
    pugi::xml_node file = parent.append_child("file");
    file.append_attribute("path") = outcome.path.generic_string().c_str();
    file.append_attribute("status") = file_status_name(outcome.status);
    file.append_attribute("spans") = static_cast<unsigned long long>(outcome.spans_found);
    file.append_attribute("selected") = static_cast<unsigned long long>(outcome.spans_selected);
    file.append_attribute("translated") = static_cast<unsigned long long>(outcome.spans_translated);
    file.append_attribute("chunks") = static_cast<unsigned long long>(outcome.chunks);
    file.append_attribute("chunks-failed") = static_cast<unsigned long long>(outcome.chunks_failed);
    file.append_attribute("written") = outcome.written;
    file.append_attribute("ms") = static_cast<long long>(outcome.elapsed.count());

    if (!outcome.reason.empty()) {
        file.append_child("reason").text() = outcome.reason.c_str();
    }
    for (const auto& warning : outcome.warnings) {
        file.append_child("warning").text() = warning.c_str();
    }
    if (!outcome.diff.empty()) {
        file.append_child("diff").append_child(pugi::node_cdata).set_value(outcome.diff.c_str());
    }
}

}  // namespace

bool write_run_report(
    const std::filesystem::path& out_path,
    const Config& config,
    const std::vector<FileOutcome>& outcomes,
    const RunStats& totals,
    const PoolStats& pool,
    bool interrupted,
    std::string& error
) {
    pugi::xml_document doc;
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    pugi::xml_node root = doc.append_child("code-mt-report");
    root.append_attribute("version") = kVersion;
    root.append_attribute("interrupted") = interrupted;

    add_settings(root, config);

    pugi::xml_node files = root.append_child("files");
    for (const auto& outcome : outcomes) {
        add_outcome(files, outcome);
    }

    pugi::xml_node summary = root.append_child("summary");
    summary.append_attribute("discovered") = static_cast<unsigned long long>(pool.files_total);
    summary.append_attribute("processed") = static_cast<unsigned long long>(totals.processed);
    summary.append_attribute("translated") = static_cast<unsigned long long>(totals.translated);
    summary.append_attribute("skipped") = static_cast<unsigned long long>(totals.skipped);
    summary.append_attribute("failed") = static_cast<unsigned long long>(totals.failed);
    summary.append_attribute("spans-translated") = static_cast<unsigned long long>(totals.spans_translated);
    summary.append_attribute("chunks-failed") = static_cast<unsigned long long>(totals.chunks_failed);
    summary.append_attribute("warnings") = static_cast<unsigned long long>(totals.warnings);
    summary.append_attribute("workers") = static_cast<unsigned long long>(pool.workers_used);
    summary.append_attribute("wall-ms") = static_cast<long long>(pool.wall_time.count());

    if (!doc.save_file(out_path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        error = "Failed to write run report: " + out_path.string();
        return false;
    }
    return true;
}

}  // namespace code_mt
