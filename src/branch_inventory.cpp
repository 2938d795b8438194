#include "branch_inventory.hpp"
#include <algorithm>
#include <sstream>
#include "logger.hpp"
#include "pattern_utils.hpp"

const std::set<std::string>& default_protected_branches() {
    static const std::set<std::string> names{"main", "develop", "master", "production"};
    return names;
}

std::vector<std::string> parse_branch_listing(const std::string& listing) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.size() >= 2 && (line[0] == '*' || line[0] == '+') && line[1] == ' ')
            line.erase(0, 2);
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos)
            continue;
        auto last = line.find_last_not_of(" \t");
        std::string name = line.substr(first, last - first + 1);
        if (name.front() == '(')
            continue;
        if (seen.insert(name).second)
            names.push_back(name);
    }
    return names;
}

bool is_remote_tracking(const std::string& name) {
    return name.rfind("remotes/", 0) == 0 || name.rfind("refs/remotes/", 0) == 0;
}

std::vector<std::string> list_candidate_branches(vcs::VcsBackend& backend,
                                                 const InventorySettings& settings,
                                                 std::ostream* diag) {
    auto res = backend.list_local_branches();
    if (!res.ok) {
        log_warning("Branch listing failed", {{"error", res.error}});
        if (diag)
            *diag << "Warning: cannot list branches: " << res.error << "\n";
        return {};
    }
    std::vector<std::string> candidates;
    for (auto& name : parse_branch_listing(res.output)) {
        if (is_remote_tracking(name))
            continue;
        if (settings.protected_names.count(name)) {
            log_debug("Skipping protected branch", {{"branch", name}});
            continue;
        }
        if (!settings.include_patterns.empty() &&
            !patterns::matches(name, settings.include_patterns)) {
            log_debug("Branch does not match any pattern", {{"branch", name}});
            continue;
        }
        candidates.push_back(std::move(name));
    }
    log_info("Branch inventory complete", {{"candidates", std::to_string(candidates.size())}});
    return candidates;
}
