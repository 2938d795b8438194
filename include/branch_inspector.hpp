#ifndef BRANCH_INSPECTOR_HPP
#define BRANCH_INSPECTOR_HPP
#include <ctime>
#include <ostream>
#include <string>
#include "branch_record.hpp"
#include "vcs_backend.hpp"

enum class MergeMatchMode {
    Exact,       ///< Listed name must equal the branch name
    LegacySuffix ///< Listed name may merely end with the branch name
};

/// First seven characters of @p full_id, or "unknown" when empty.
std::string short_commit_id(const std::string& full_id);

/**
 * @brief Look for @p name in `git branch --merged` output.
 *
 * Lines are stripped of their `* ` / `+ ` markers and surrounding whitespace.
 * With MergeMatchMode::LegacySuffix a line such as `hotfix` also satisfies
 * `fix`.
 */
bool merged_listing_contains(const std::string& listing, const std::string& name,
                             MergeMatchMode mode);

/// Decimal count from `git rev-list --count`; 0 for anything unparsable.
int parse_commit_count(const std::string& text);

/**
 * @brief Builds a BranchRecord for one branch at a time.
 *
 * Each query is independent. A failing or throwing query degrades to the
 * conservative default for that field and the record is still produced.
 */
class BranchInspector {
  public:
    /**
     * @param backend Repository to query.
     * @param trunk   Resolved trunk ref; empty when it could not be resolved,
     *                in which case every branch reads as unmerged.
     * @param mode    Merge membership matching.
     * @param now     Scan time used for ages and as the timestamp fallback.
     * @param diag    Optional stream receiving a `Warning: <branch>: ...` line
     *                for every degraded query, in addition to the log.
     */
    BranchInspector(vcs::VcsBackend& backend, std::string trunk, MergeMatchMode mode,
                    std::time_t now, std::ostream* diag = nullptr);

    BranchRecord inspect(const std::string& name);

  private:
    std::string query_commit_id(const std::string& name);
    std::time_t query_commit_time(const std::string& name);
    bool query_merged(const std::string& name);
    int query_commits_ahead(const std::string& name);
    void warn(const std::string& name, const std::string& what, const std::string& detail);

    vcs::VcsBackend& backend_;
    std::string trunk_;
    MergeMatchMode mode_;
    std::time_t now_;
    std::ostream* diag_;
};

#endif // BRANCH_INSPECTOR_HPP
