#ifndef BRANCH_INVENTORY_HPP
#define BRANCH_INVENTORY_HPP
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "vcs_backend.hpp"

/**
 * @brief Names excluded from every scan unless explicitly dropped:
 *        main, develop, master, production.
 */
const std::set<std::string>& default_protected_branches();

struct InventorySettings {
    std::set<std::string> protected_names;    ///< Exact, case-sensitive
    std::vector<std::string> include_patterns; ///< Empty means every branch
};

/**
 * @brief Split branch listing output into names.
 *
 * Strips the `* ` (current) and `+ ` (checked out elsewhere) markers and drops
 * detached HEAD entries such as `(HEAD detached at 1a2b3c)`. Duplicate names
 * keep their first position.
 */
std::vector<std::string> parse_branch_listing(const std::string& listing);

/// `remotes/...` or `refs/remotes/...`.
bool is_remote_tracking(const std::string& name);

/**
 * @brief Enumerate local branches eligible for inspection.
 *
 * Remote-tracking references and protected names are removed; when include
 * patterns are configured only matching names remain. A failed listing is
 * logged, reported on @p diag when given, and yields an empty inventory.
 */
std::vector<std::string> list_candidate_branches(vcs::VcsBackend& backend,
                                                 const InventorySettings& settings,
                                                 std::ostream* diag = nullptr);

#endif // BRANCH_INVENTORY_HPP
