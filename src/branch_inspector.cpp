#include "branch_inspector.hpp"
#include <cctype>
#include <exception>
#include <limits>
#include <sstream>
#include <utility>
#include "logger.hpp"
#include "time_utils.hpp"

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string short_commit_id(const std::string& full_id) {
    std::string id = trim(full_id);
    if (id.empty())
        return UNKNOWN_COMMIT_ID;
    return id.substr(0, 7);
}

bool merged_listing_contains(const std::string& listing, const std::string& name,
                             MergeMatchMode mode) {
    if (name.empty())
        return false;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() >= 2 && (line[0] == '*' || line[0] == '+') && line[1] == ' ')
            line.erase(0, 2);
        std::string entry = trim(line);
        if (entry.empty())
            continue;
        if (entry == name)
            return true;
        if (mode == MergeMatchMode::LegacySuffix && ends_with(entry, name))
            return true;
    }
    return false;
}

int parse_commit_count(const std::string& text) {
    std::string t = trim(text);
    if (t.empty())
        return 0;
    long long value = 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return 0;
        value = value * 10 + (c - '0');
        if (value > std::numeric_limits<int>::max())
            return std::numeric_limits<int>::max();
    }
    return static_cast<int>(value);
}

BranchInspector::BranchInspector(vcs::VcsBackend& backend, std::string trunk,
                                 MergeMatchMode mode, std::time_t now, std::ostream* diag)
    : backend_(backend), trunk_(std::move(trunk)), mode_(mode), now_(now), diag_(diag) {}

void BranchInspector::warn(const std::string& name, const std::string& what,
                           const std::string& detail) {
    log_warning(what, {{"branch", name}, {"error", detail}});
    if (diag_)
        *diag_ << "Warning: " << name << ": " << what << ": " << detail << "\n";
}

BranchRecord BranchInspector::inspect(const std::string& name) {
    BranchRecord rec;
    rec.name = name;
    rec.commit_id = query_commit_id(name);
    rec.last_commit_time = query_commit_time(name);
    rec.is_merged = query_merged(name);
    rec.commits_ahead = query_commits_ahead(name);
    rec.age_days = whole_days_between(rec.last_commit_time, now_);
    if (rec.merge_signals_disagree()) {
        log_warning("Merge signals disagree",
                    {{"branch", name}, {"commits_ahead", std::to_string(rec.commits_ahead)}});
    }
    log_debug("Inspected branch", {{"branch", name},
                                   {"commit", rec.commit_id},
                                   {"age_days", std::to_string(rec.age_days)},
                                   {"merged", rec.is_merged ? "true" : "false"}});
    return rec;
}

std::string BranchInspector::query_commit_id(const std::string& name) {
    try {
        auto res = backend_.resolve_commit(name);
        if (res.ok)
            return short_commit_id(res.output);
        warn(name, "could not resolve branch tip", res.error);
    } catch (const std::exception& e) {
        warn(name, "commit lookup failed", e.what());
    }
    return UNKNOWN_COMMIT_ID;
}

std::time_t BranchInspector::query_commit_time(const std::string& name) {
    try {
        auto res = backend_.commit_timestamp(name);
        if (res.ok) {
            if (auto t = parse_commit_timestamp(res.output))
                return *t;
            warn(name, "unparsable commit timestamp", trim(res.output));
        } else {
            warn(name, "could not read commit timestamp", res.error);
        }
    } catch (const std::exception& e) {
        warn(name, "timestamp lookup failed", e.what());
    }
    return now_;
}

bool BranchInspector::query_merged(const std::string& name) {
    if (trunk_.empty())
        return false;
    try {
        auto res = backend_.merged_branches(trunk_);
        if (res.ok)
            return merged_listing_contains(res.output, name, mode_);
        warn(name, "merged listing failed", res.error);
    } catch (const std::exception& e) {
        warn(name, "merged listing failed", e.what());
    }
    return false;
}

int BranchInspector::query_commits_ahead(const std::string& name) {
    if (trunk_.empty())
        return 0;
    try {
        auto res = backend_.count_commits_ahead(trunk_, name);
        if (res.ok)
            return parse_commit_count(res.output);
        warn(name, "ahead count failed", res.error);
    } catch (const std::exception& e) {
        warn(name, "ahead count failed", e.what());
    }
    return 0;
}
