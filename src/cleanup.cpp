#include "cleanup.hpp"
#include <exception>
#include "logger.hpp"
#include "pattern_utils.hpp"

namespace {

std::string first_line(const std::string& text) {
    auto end = text.find_first_of("\r\n");
    return end == std::string::npos ? text : text.substr(0, end);
}

const BranchRecord* find_record(const std::vector<BranchRecord>& records,
                                const std::string& name) {
    for (const auto& r : records) {
        if (r.name == name)
            return &r;
    }
    return nullptr;
}

} // namespace

BranchAction decide_action(const BranchRecord& rec, const CleanupSettings& settings) {
    if (settings.protected_names.count(rec.name) ||
        patterns::matches(rec.name, settings.protected_patterns))
        return BranchAction::Protect;
    if (rec.is_merged && !(settings.strict_merge_check && rec.commits_ahead > 0))
        return BranchAction::Delete;
    return BranchAction::Preserve;
}

ClassificationSummary classify(const std::vector<BranchRecord>& stale,
                               const CleanupSettings& settings) {
    ClassificationSummary summary;
    summary.total_stale = stale.size();
    for (const auto& rec : stale) {
        if (rec.merge_signals_disagree())
            summary.merge_conflicts.push_back(rec.name);
        switch (decide_action(rec, settings)) {
        case BranchAction::Protect:
            summary.protected_names.push_back(rec.name);
            break;
        case BranchAction::Delete:
            summary.deletable.push_back(rec.name);
            break;
        case BranchAction::Preserve:
            summary.unmerged.push_back({rec.name, rec.commits_ahead, rec.last_commit_time});
            break;
        }
    }
    return summary;
}

CleanupResult run_cleanup(vcs::VcsBackend& backend, const std::vector<BranchRecord>& stale,
                          const CleanupSettings& settings, std::ostream* out) {
    CleanupResult result;
    result.summary = classify(stale, settings);
    const auto& summary = result.summary;

    for (const auto& name : summary.protected_names) {
        log_info("Protected branch kept", {{"branch", name}});
        if (out)
            *out << "Skipping protected branch: " << name << "\n";
    }
    for (const auto& u : summary.unmerged) {
        log_info("Unmerged branch kept",
                 {{"branch", u.name}, {"commits_ahead", std::to_string(u.commits_ahead)}});
        if (out)
            *out << "Skipping unmerged branch: " << u.name << " (" << u.commits_ahead
                 << " commits ahead of trunk)\n";
    }
    for (const auto& name : summary.merge_conflicts) {
        if (out)
            *out << "Warning: " << name
                 << " is listed as merged but has commits the trunk lacks\n";
    }

    for (const auto& name : summary.deletable) {
        const BranchRecord* rec = find_record(stale, name);
        DeletionOutcome outcome;
        outcome.name = name;
        outcome.commit_id = rec ? rec->commit_id : UNKNOWN_COMMIT_ID;

        if (settings.dry_run) {
            outcome.status = DeletionStatus::WouldDelete;
            log_info("Would delete branch", {{"branch", name}, {"commit", outcome.commit_id}});
            if (out)
                *out << "[DRY RUN] Would delete branch: " << name << " ("
                     << (rec ? rec->age_days : 0) << " days old, commit: " << outcome.commit_id
                     << ")\n";
            result.outcomes.push_back(std::move(outcome));
            continue;
        }

        vcs::QueryResult res;
        try {
            res = backend.force_delete_branch(name);
        } catch (const std::exception& e) {
            res = vcs::QueryResult::failure(e.what());
        }
        if (res.ok) {
            outcome.status = DeletionStatus::Deleted;
            outcome.message = first_line(res.output);
            log_info("Deleted branch", {{"branch", name}, {"commit", outcome.commit_id}});
            if (out)
                *out << "Deleted merged branch: " << name << " ("
                     << (rec ? rec->age_days : 0) << " days old, commit: " << outcome.commit_id
                     << ")\n";
        } else {
            outcome.status = DeletionStatus::Failed;
            outcome.message = first_line(res.error);
            log_error("Failed to delete branch", {{"branch", name}, {"error", res.error}});
            if (out)
                *out << "Error deleting branch " << name << ": " << outcome.message << "\n";
        }
        result.outcomes.push_back(std::move(outcome));
    }
    return result;
}
