#ifndef STALENESS_HPP
#define STALENESS_HPP
#include <vector>
#include "branch_record.hpp"

constexpr int DEFAULT_STALE_DAYS = 30;

/// A branch is stale once it is strictly older than @p threshold_days.
inline bool is_stale(const BranchRecord& rec, int threshold_days) {
    return rec.age_days > threshold_days;
}

/**
 * @brief Keep the records older than @p threshold_days, preserving order.
 */
std::vector<BranchRecord> select_stale(const std::vector<BranchRecord>& records,
                                       int threshold_days);

#endif // STALENESS_HPP
