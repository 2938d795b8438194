#include "staleness.hpp"
#include <algorithm>
#include <iterator>

std::vector<BranchRecord> select_stale(const std::vector<BranchRecord>& records,
                                       int threshold_days) {
    std::vector<BranchRecord> stale;
    std::copy_if(records.begin(), records.end(), std::back_inserter(stale),
                 [threshold_days](const BranchRecord& r) { return is_stale(r, threshold_days); });
    return stale;
}
