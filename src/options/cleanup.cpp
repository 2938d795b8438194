// options/cleanup.cpp
//
// Parse protection, branch filtering and merge-check settings.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "arg_parser.hpp"
#include "branch_inventory.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "pattern_utils.hpp"

namespace fs = std::filesystem;

namespace {

/// Values from the command line first, then the config file; each value may
/// itself be a comma list.
std::vector<std::string> collect_list(const ArgParser& parser, const ConfigOpt& cfg_opt,
                                      const std::map<std::string, std::string>& cfg_opts,
                                      const std::string& key) {
    std::vector<std::string> out;
    for (const auto& v : parser.get_all_options(key)) {
        if (v.empty())
            throw std::runtime_error(key + " requires a value");
        for (auto& item : split_list(v))
            out.push_back(item);
    }
    if (cfg_opts.count(key)) {
        for (auto& item : split_list(cfg_opt(key)))
            out.push_back(item);
    }
    return out;
}

} // namespace

void parse_cleanup_options(Options& opts, const ArgParser& parser, const ConfigFlag& cfg_flag,
                           const ConfigOpt& cfg_opt,
                           const std::map<std::string, std::string>& cfg_opts) {
    opts.protected_names.clear();
    if (!(parser.has_flag("--no-default-protect") || cfg_flag("--no-default-protect")))
        opts.protected_names = default_protected_branches();

    for (auto& name : collect_list(parser, cfg_opt, cfg_opts, "--protect")) {
        if (patterns::is_glob(name))
            opts.protected_patterns.push_back(name);
        else
            opts.protected_names.insert(name);
    }
    for (auto& pat : collect_list(parser, cfg_opt, cfg_opts, "--protect-pattern"))
        opts.protected_patterns.push_back(pat);

    for (auto& file : collect_list(parser, cfg_opt, cfg_opts, "--protect-file")) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec))
            throw std::runtime_error("Cannot read protect file: " + file);
        for (auto& entry : patterns::read_pattern_file(file)) {
            if (patterns::is_glob(entry))
                opts.protected_patterns.push_back(entry);
            else
                opts.protected_names.insert(entry);
        }
    }
    opts.protected_names.insert(opts.trunk);

    opts.branch_patterns = collect_list(parser, cfg_opt, cfg_opts, "--branch-pattern");

    if (parser.has_flag("--legacy-merge-match") || cfg_flag("--legacy-merge-match"))
        opts.merge_match = MergeMatchMode::LegacySuffix;
    opts.strict_merge_check =
        parser.has_flag("--strict-merge-check") || cfg_flag("--strict-merge-check");
}
