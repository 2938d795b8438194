#ifndef BRANCH_RECORD_HPP
#define BRANCH_RECORD_HPP
#include <ctime>
#include <string>
#include <vector>

/// Commit id reported when a branch tip cannot be resolved.
constexpr const char* UNKNOWN_COMMIT_ID = "unknown";

/**
 * @brief Snapshot of one local branch taken during a scan.
 */
struct BranchRecord {
    std::string name;                         ///< Branch name, unique within a scan
    std::string commit_id = UNKNOWN_COMMIT_ID; ///< Short hash of the tip
    std::time_t last_commit_time = 0;         ///< Tip authorship time (UTC)
    bool is_merged = false;                   ///< Listed in the trunk's merged set
    int commits_ahead = 0;                    ///< Commits in trunk..branch
    int age_days = 0;                         ///< Whole days since last_commit_time

    /// Both merge signals were computed independently; they may disagree.
    bool merge_signals_disagree() const { return is_merged && commits_ahead > 0; }
};

/**
 * @brief A stale branch kept because trunk does not contain it.
 */
struct UnmergedBranch {
    std::string name;
    int commits_ahead = 0;
    std::time_t last_commit_time = 0;

    bool operator==(const UnmergedBranch& o) const {
        return name == o.name && commits_ahead == o.commits_ahead &&
               last_commit_time == o.last_commit_time;
    }
};

/**
 * @brief Result of classifying the stale set. Built once, never mutated.
 */
struct ClassificationSummary {
    size_t total_stale = 0;
    std::vector<std::string> deletable;       ///< Stale, merged, not protected
    std::vector<UnmergedBranch> unmerged;     ///< Stale, not merged
    std::vector<std::string> protected_names; ///< Stale but protected
    std::vector<std::string> merge_conflicts; ///< Merged yet reported commits ahead

    bool operator==(const ClassificationSummary& o) const {
        return total_stale == o.total_stale && deletable == o.deletable &&
               unmerged == o.unmerged && protected_names == o.protected_names &&
               merge_conflicts == o.merge_conflicts;
    }
};

enum class DeletionStatus {
    Deleted,     ///< Branch pointer removed
    WouldDelete, ///< Dry run; nothing was changed
    Failed       ///< Delete attempted and refused
};

const char* to_string(DeletionStatus status);

/**
 * @brief Outcome of one attempted deletion, in processing order.
 */
struct DeletionOutcome {
    std::string name;
    std::string commit_id;
    DeletionStatus status = DeletionStatus::Failed;
    std::string message;
};

/**
 * @brief Everything one cleanup pass produced.
 */
struct CleanupResult {
    ClassificationSummary summary;
    std::vector<DeletionOutcome> outcomes;

    /// Names removed this run; empty for dry runs.
    std::vector<std::string> deleted() const;
    size_t failed_count() const;
};

#endif // BRANCH_RECORD_HPP
