#include "report.hpp"
#include <fstream>
#include <sstream>
#include "time_utils.hpp"

namespace {

const std::string RULE(70, '=');
const std::string THIN_RULE(70, '-');

size_t count_status(const std::vector<DeletionOutcome>& outcomes, DeletionStatus status) {
    size_t n = 0;
    for (const auto& o : outcomes) {
        if (o.status == status)
            ++n;
    }
    return n;
}

const DeletionOutcome* outcome_for(const std::vector<DeletionOutcome>& outcomes,
                                   const std::string& name) {
    for (const auto& o : outcomes) {
        if (o.name == name)
            return &o;
    }
    return nullptr;
}

void section(std::ostringstream& os, const std::string& title) {
    os << title << "\n" << THIN_RULE << "\n";
}

} // namespace

const char* to_string(RunMode mode) { return mode == RunMode::DryRun ? "DRY RUN" : "LIVE"; }

std::string render_report(const ClassificationSummary& summary, const ReportContext& ctx,
                          const std::vector<DeletionOutcome>& outcomes) {
    const bool dry = ctx.mode == RunMode::DryRun;
    const size_t failed = count_status(outcomes, DeletionStatus::Failed);
    const size_t removed = dry ? count_status(outcomes, DeletionStatus::WouldDelete)
                               : count_status(outcomes, DeletionStatus::Deleted);

    std::ostringstream os;
    os << RULE << "\n" << "GIT BRANCH CLEANUP REPORT\n" << RULE << "\n";
    os << "Execution Mode: " << to_string(ctx.mode) << "\n";
    os << "Timestamp: " << format_iso_utc(ctx.generated_at) << "\n";
    os << "Age Threshold: " << ctx.threshold_days << " days\n";
    os << "Trunk: " << ctx.trunk << "\n\n";

    section(os, "SUMMARY");
    os << "Total Stale Branches Found: " << summary.total_stale << "\n";
    os << (dry ? "Branches To Delete (Merged): " : "Branches Deleted (Merged): ") << removed
       << "\n";
    os << "Branches Skipped (Unmerged): " << summary.unmerged.size() << "\n";
    os << "Branches Protected: " << summary.protected_names.size() << "\n";
    if (failed > 0)
        os << "Delete Failures: " << failed << "\n";
    if (!summary.merge_conflicts.empty())
        os << "Merge Signal Conflicts: " << summary.merge_conflicts.size() << "\n";
    os << "\n";

    if (!summary.deletable.empty()) {
        section(os, dry ? "BRANCHES TO DELETE" : "DELETED BRANCHES");
        for (const auto& name : summary.deletable) {
            const DeletionOutcome* o = outcome_for(outcomes, name);
            if (o && o->status == DeletionStatus::Failed) {
                os << "  x " << name << "\n";
                os << "    Error: " << o->message << "\n";
            } else {
                os << "  + " << name;
                if (o && o->commit_id != UNKNOWN_COMMIT_ID)
                    os << " (" << o->commit_id << ")";
                os << "\n";
            }
        }
        os << "\n";
    }

    if (!summary.unmerged.empty()) {
        section(os, "UNMERGED BRANCHES (Preserved for safety)");
        for (const auto& u : summary.unmerged) {
            os << "  ! " << u.name << "\n";
            os << "    Commits ahead: " << u.commits_ahead << "\n";
            os << "    Last commit: " << format_iso_utc(u.last_commit_time) << "\n";
        }
        os << "\n";
    }

    if (!summary.protected_names.empty()) {
        section(os, "PROTECTED BRANCHES (Never deleted)");
        for (const auto& name : summary.protected_names)
            os << "  # " << name << "\n";
        os << "\n";
    }

    if (!summary.merge_conflicts.empty()) {
        section(os, "MERGE SIGNAL CONFLICTS (Listed as merged, commits ahead)");
        for (const auto& name : summary.merge_conflicts)
            os << "  ? " << name << "\n";
        os << "\n";
    }

    os << RULE << "\n" << "END OF REPORT\n" << RULE << "\n";
    return os.str();
}

nlohmann::json summary_to_json(const ClassificationSummary& summary) {
    nlohmann::json unmerged = nlohmann::json::array();
    for (const auto& u : summary.unmerged) {
        unmerged.push_back({{"branch", u.name},
                            {"commits_ahead", u.commits_ahead},
                            {"last_commit", format_iso_utc(u.last_commit_time)}});
    }
    return {{"total_stale", summary.total_stale},
            {"deletable", summary.deletable},
            {"unmerged", unmerged},
            {"protected", summary.protected_names},
            {"merge_conflicts", summary.merge_conflicts}};
}

nlohmann::json report_to_json(const ClassificationSummary& summary, const ReportContext& ctx,
                              const std::vector<DeletionOutcome>& outcomes) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& o : outcomes) {
        out.push_back({{"branch", o.name},
                       {"commit", o.commit_id},
                       {"status", to_string(o.status)},
                       {"message", o.message}});
    }
    return {{"mode", ctx.mode == RunMode::DryRun ? "dry_run" : "live"},
            {"timestamp", format_iso_utc(ctx.generated_at)},
            {"threshold_days", ctx.threshold_days},
            {"trunk", ctx.trunk},
            {"summary", summary_to_json(summary)},
            {"outcomes", out}};
}

std::string render_json_report(const ClassificationSummary& summary, const ReportContext& ctx,
                               const std::vector<DeletionOutcome>& outcomes) {
    return report_to_json(summary, ctx, outcomes).dump(2) + "\n";
}

bool write_report(const std::filesystem::path& path, const std::string& text,
                  std::string& error) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        error = "cannot open " + path.string() + " for writing";
        return false;
    }
    ofs << text;
    ofs.flush();
    if (!ofs) {
        error = "failed writing " + path.string();
        return false;
    }
    return true;
}
