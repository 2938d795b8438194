#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--repo", "-r", "<path>", "Repository to clean (default: positional or .)", "Basics"},
        {"--days", "-d", "<n>", "Branches older than N days are stale (default 30)", "Basics"},
        {"--trunk", "-t", "<name>", "Branch merges are checked against (default main)",
         "Basics"},
        {"--dry-run", "-n", "", "Show what would be deleted without changing anything",
         "Basics"},
        {"--backend", "", "<libgit2|git>", "Repository access backend (default libgit2)",
         "Basics"},
        {"--protect", "", "<names>", "Never delete these branches (repeatable, comma list)",
         "Protection"},
        {"--protect-pattern", "", "<glob>", "Never delete branches matching glob (repeatable)",
         "Protection"},
        {"--protect-file", "", "<file>", "Read protected names or globs, one per line",
         "Protection"},
        {"--no-default-protect", "", "", "Drop main, develop, master and production",
         "Protection"},
        {"--branch-pattern", "", "<glob>", "Only consider matching branches (repeatable)",
         "Filtering"},
        {"--require-clean", "", "", "Refuse to run when the worktree has changes", "Safety"},
        {"--strict-merge-check", "", "", "Also require zero commits ahead of trunk", "Safety"},
        {"--legacy-merge-match", "", "", "Match merged branches by name suffix", "Safety"},
        {"--output", "-o", "<file>", "Save the report to a file", "Output"},
        {"--summary-json", "", "<file>", "Save the summary as JSON", "Output"},
        {"--silent", "-s", "", "Disable per-branch console output", "Output"},
        {"--auto-config", "", "", "Auto detect .stalebranch.yaml or .stalebranch.json",
         "Config"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<file>", "Write log entries to file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Shortcut for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON lines", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file at this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Mirror log entries to syslog", "Logging"},
        {"--syslog-facility", "", "<name>", "Syslog facility (user, daemon, local0-7)",
         "Logging"},
        {"--version", "-v", "", "Show program version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    os << "stalebranch - Stale Git Branch Cleanup\n";
    os << "Deletes local branches that are old and fully merged into the trunk.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " [options] [repo-path]\n\n";
    const std::vector<std::string> order{"Basics", "Protection", "Filtering", "Safety",
                                         "Output", "Config",     "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o) << o->desc
               << "\n";
        }
        os << "\n";
    }
    os << "Exit codes: 0 live run, 1 dry run, 2 setup error, 3 live run report not written\n";
}
