#include "branch_record.hpp"
#include <algorithm>

const char* to_string(DeletionStatus status) {
    switch (status) {
    case DeletionStatus::Deleted:
        return "deleted";
    case DeletionStatus::WouldDelete:
        return "would_delete";
    case DeletionStatus::Failed:
        return "failed";
    }
    return "failed";
}

std::vector<std::string> CleanupResult::deleted() const {
    std::vector<std::string> names;
    for (const auto& o : outcomes) {
        if (o.status == DeletionStatus::Deleted)
            names.push_back(o.name);
    }
    return names;
}

size_t CleanupResult::failed_count() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const auto& o) {
        return o.status == DeletionStatus::Failed;
    }));
}
