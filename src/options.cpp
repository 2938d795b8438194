#include <algorithm>
#include <cctype>
#include <climits>
#include <filesystem>
#include <map>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Logging and cleanup specific parsing lives in src/options/logging.cpp and
// src/options/cleanup.cpp.

const std::set<std::string>& option_value_flags() {
    static const std::set<std::string> flags{"--days",
                                             "--output",
                                             "--repo",
                                             "--trunk",
                                             "--protect",
                                             "--protect-pattern",
                                             "--protect-file",
                                             "--branch-pattern",
                                             "--backend",
                                             "--summary-json",
                                             "--config-yaml",
                                             "--config-json",
                                             "--log-file",
                                             "--log-level",
                                             "--max-log-size",
                                             "--max-log-files",
                                             "--syslog-facility"};
    return flags;
}

const std::map<char, std::string>& option_short_map() {
    static const std::map<char, std::string> shorts{
        {'n', "--dry-run"},     {'d', "--days"},        {'o', "--output"},
        {'r', "--repo"},        {'t', "--trunk"},       {'s', "--silent"},
        {'y', "--config-yaml"}, {'j', "--config-json"}, {'l', "--log-file"},
        {'L', "--log-level"},   {'g', "--verbose"},     {'h', "--help"},
        {'v', "--version"}};
    return shorts;
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(argc, argv, cfg_opts, config_file);

    const auto& value_flags = option_value_flags();
    std::set<std::string> known{"--dry-run",
                                "--no-default-protect",
                                "--legacy-merge-match",
                                "--strict-merge-check",
                                "--require-clean",
                                "--silent",
                                "--auto-config",
                                "--verbose",
                                "--json-log",
                                "--compress-logs",
                                "--syslog",
                                "--help",
                                "--version"};
    known.insert(value_flags.begin(), value_flags.end());
    ArgParser parser(argc, argv, known, option_short_map(), value_flags);
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first) || kv.first == "--help" || kv.first == "--version")
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        return it->second.empty() || parse_switch(it->second);
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::string();
    };

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (!parser.unknown_flags().empty()) {
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    }
    if (opts.show_help || opts.print_version)
        return opts;

    bool ok = false;
    opts.dry_run = parser.has_flag("--dry-run") || cfg_flag("--dry-run");
    opts.silent = parser.has_flag("--silent") || cfg_flag("--silent");
    opts.auto_config = parser.has_flag("--auto-config") || cfg_flag("--auto-config");
    opts.require_clean = parser.has_flag("--require-clean") || cfg_flag("--require-clean");

    if (parser.has_flag("--days")) {
        opts.days = parse_int(parser, "--days", 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --days");
    } else if (cfg_opts.count("--days")) {
        opts.days = parse_int(cfg_opt("--days"), 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --days");
    }

    if (parser.has_flag("--repo") || cfg_opts.count("--repo")) {
        std::string val = parser.get_option("--repo");
        if (val.empty())
            val = cfg_opt("--repo");
        if (val.empty())
            throw std::runtime_error("--repo requires a path");
        opts.repo = val;
    }
    if (!parser.positional().empty()) {
        if (parser.positional().size() > 1)
            throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);
        if (parser.has_flag("--repo"))
            throw std::runtime_error("Repository given twice");
        opts.repo = parser.positional().front();
    }

    if (parser.has_flag("--trunk") || cfg_opts.count("--trunk")) {
        std::string val = parser.get_option("--trunk");
        if (val.empty())
            val = cfg_opt("--trunk");
        if (val.empty())
            throw std::runtime_error("--trunk requires a branch name");
        opts.trunk = val;
    }

    if (parser.has_flag("--output") || cfg_opts.count("--output")) {
        std::string val = parser.get_option("--output");
        if (val.empty())
            val = cfg_opt("--output");
        if (val.empty())
            throw std::runtime_error("--output requires a file");
        opts.output_file = val;
    }
    if (parser.has_flag("--summary-json") || cfg_opts.count("--summary-json")) {
        std::string val = parser.get_option("--summary-json");
        if (val.empty())
            val = cfg_opt("--summary-json");
        if (val.empty())
            throw std::runtime_error("--summary-json requires a file");
        opts.summary_json = val;
    }

    if (parser.has_flag("--backend") || cfg_opts.count("--backend")) {
        std::string val = parser.get_option("--backend");
        if (val.empty())
            val = cfg_opt("--backend");
        auto kind = vcs::parse_backend_kind(val);
        if (!kind)
            throw std::runtime_error("Invalid value for --backend: " + val);
        opts.backend = *kind;
    }

    parse_logging_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);
    parse_cleanup_options(opts, parser, cfg_flag, cfg_opt, cfg_opts);

    opts.config_file = config_file;
    return opts;
}
