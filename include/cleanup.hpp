#ifndef CLEANUP_HPP
#define CLEANUP_HPP
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "branch_record.hpp"
#include "vcs_backend.hpp"

struct CleanupSettings {
    bool dry_run = false;
    std::set<std::string> protected_names;
    std::vector<std::string> protected_patterns; ///< Globs, see patterns::matches
    bool strict_merge_check = false; ///< Also require commits_ahead == 0
};

enum class BranchAction { Protect, Delete, Preserve };

/**
 * @brief First matching rule wins: protected, then merged, then preserved.
 */
BranchAction decide_action(const BranchRecord& rec, const CleanupSettings& settings);

/**
 * @brief Partition the stale records into summary buckets.
 *
 * Pure; makes no repository calls and preserves input order in every bucket.
 */
ClassificationSummary classify(const std::vector<BranchRecord>& stale,
                               const CleanupSettings& settings);

/**
 * @brief Classify @p stale and delete (or simulate deleting) the deletable set.
 *
 * Deletion failures are logged and recorded as DeletionStatus::Failed
 * outcomes; the remaining branches are still processed. In dry-run mode no
 * mutating call reaches @p backend.
 *
 * @param out Destination for per-branch progress lines, or nullptr.
 */
CleanupResult run_cleanup(vcs::VcsBackend& backend, const std::vector<BranchRecord>& stale,
                          const CleanupSettings& settings, std::ostream* out = nullptr);

#endif // CLEANUP_HPP
