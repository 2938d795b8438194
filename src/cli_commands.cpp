#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "branch_inspector.hpp"
#include "branch_inventory.hpp"
#include "cleanup.hpp"
#include "cli_commands.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "staleness.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {

const std::string BANNER(70, '=');

void require_clean_worktree(vcs::VcsBackend& backend) {
    auto status = backend.worktree_status();
    if (!status.ok)
        throw vcs::SetupError("Cannot read worktree status: " + status.error);
    if (status.output.find_first_not_of(" \t\r\n") != std::string::npos)
        throw vcs::SetupError("Worktree has uncommitted changes; commit or stash them first");
}

bool write_file(const fs::path& path, const std::string& text, const char* what,
                std::ostream& out, std::ostream& err, bool silent) {
    std::string error;
    if (!write_report(path, text, error)) {
        log_error(std::string("Failed to write ") + what, {{"path", path.string()},
                                                           {"error", error}});
        err << "Failed to write " << what << ": " << error << "\n";
        return false;
    }
    log_info(std::string(what) + " written", {{"path", path.string()}});
    if (!silent)
        out << "\n" << what << " saved to: " << path.string() << "\n";
    return true;
}

} // namespace

void configure_logging(const LoggingOptions& logging) {
    set_log_level(logging.log_level);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (!logging.log_file.empty())
        init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                    logging.max_log_files);
    if (logging.use_syslog)
        init_syslog(logging.syslog_facility);
}

int run_cleanup_command(const Options& opts, vcs::VcsBackend& backend, std::time_t now,
                        std::ostream& out, std::ostream& err) {
    log_info("Cleanup run started", {{"repo", opts.repo.string()},
                                     {"backend", backend.name()},
                                     {"days", std::to_string(opts.days)},
                                     {"dry_run", opts.dry_run ? "true" : "false"}});
    if (opts.require_clean)
        require_clean_worktree(backend);

    if (opts.merge_match == MergeMatchMode::LegacySuffix) {
        log_warning("Legacy suffix merge matching enabled");
        err << "Warning: --legacy-merge-match treats any merged branch ending with a name as "
               "that branch\n";
    }

    std::string trunk_ref;
    if (auto resolved = vcs::resolve_trunk(backend, opts.trunk)) {
        trunk_ref = *resolved;
        if (trunk_ref != opts.trunk)
            log_info("Using remote trunk", {{"trunk", trunk_ref}});
    } else {
        log_warning("Trunk not found; treating every branch as unmerged",
                    {{"trunk", opts.trunk}});
        err << "Warning: trunk '" << opts.trunk
            << "' not found; no branch will be considered merged\n";
    }

    if (!opts.silent) {
        out << BANNER << "\nBRANCH CLEANUP UTILITY\n" << BANNER << "\n\n";
        out << "Scanning for branches older than " << opts.days << " days...\n\n";
    }

    InventorySettings inventory{opts.protected_names, opts.branch_patterns};
    std::vector<BranchRecord> records;
    BranchInspector inspector(backend, trunk_ref, opts.merge_match, now, &err);
    for (const auto& name : list_candidate_branches(backend, inventory, &err))
        records.push_back(inspector.inspect(name));

    auto stale = select_stale(records, opts.days);
    log_info("Stale branches selected", {{"inspected", std::to_string(records.size())},
                                         {"stale", std::to_string(stale.size())}});
    if (!opts.silent) {
        if (stale.empty()) {
            out << "No stale branches found!\n";
        } else {
            out << "Found " << stale.size() << " stale branch(es):\n\n";
            for (const auto& b : stale)
                out << "  - " << b.name << " (" << b.age_days
                    << " days old, merged: " << (b.is_merged ? "yes" : "no") << ")\n";
        }
        out << "\n";
    }

    CleanupSettings settings;
    settings.dry_run = opts.dry_run;
    settings.protected_names = opts.protected_names;
    settings.protected_patterns = opts.protected_patterns;
    settings.strict_merge_check = opts.strict_merge_check;
    CleanupResult result = run_cleanup(backend, stale, settings, opts.silent ? nullptr : &out);

    ReportContext ctx;
    ctx.mode = opts.dry_run ? RunMode::DryRun : RunMode::Live;
    ctx.threshold_days = opts.days;
    ctx.generated_at = now;
    ctx.trunk = trunk_ref.empty() ? opts.trunk : trunk_ref;
    std::string report = render_report(result.summary, ctx, result.outcomes);
    out << "\n" << report;

    bool written = true;
    if (!opts.output_file.empty())
        written = write_file(opts.output_file, report, "Report", out, err, opts.silent) && written;
    if (!opts.summary_json.empty()) {
        written = write_file(opts.summary_json,
                             render_json_report(result.summary, ctx, result.outcomes),
                             "JSON summary", out, err, opts.silent) &&
                  written;
    }

    log_info("Cleanup run finished", {{"deleted", std::to_string(result.deleted().size())},
                                      {"failed", std::to_string(result.failed_count())}});
    // Dry runs always exit 1; a failed write only shows on stderr.
    if (opts.dry_run)
        return EXIT_DRY_RUN;
    return written ? EXIT_LIVE_RUN : EXIT_WRITE_FAILED;
}

int handle_cleanup_run(const Options& opts) {
    auto backend = vcs::open_backend(opts.backend, opts.repo);
    return run_cleanup_command(opts, *backend, std::time(nullptr), std::cout, std::cerr);
}

} // namespace cli
