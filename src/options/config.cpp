// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

static void load_config_file(const fs::path& path, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool loaded = path.extension() == ".json" ? load_json_config(path.string(), cfg_opts, err)
                                              : load_yaml_config(path.string(), cfg_opts, err);
    if (!loaded)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    // Accepts every flag; parse_options() reports the unknown ones.
    ArgParser pre_parser(argc, argv, {}, option_short_map(), option_value_flags());

    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }

    auto it = cfg_opts.find("--auto-config");
    bool want_auto = pre_parser.has_flag("--auto-config") ||
                     (it != cfg_opts.end() && (it->second.empty() || parse_switch(it->second)));
    if (!want_auto)
        return;

    fs::path repo_hint;
    if (pre_parser.has_flag("--repo"))
        repo_hint = pre_parser.get_option("--repo");
    else if (!pre_parser.positional().empty())
        repo_hint = pre_parser.positional().front();
    else if (cfg_opts.count("--repo"))
        repo_hint = cfg_opts["--repo"];

    fs::path exe_dir;
    if (argv && argv[0])
        exe_dir = fs::absolute(argv[0]).parent_path();
    auto found = find_auto_config({repo_hint, fs::current_path(), exe_dir});
    if (!found)
        return;

    // Values from explicitly named files take precedence.
    std::map<std::string, std::string> discovered;
    load_config_file(*found, discovered);
    for (auto& kv : cfg_opts)
        discovered[kv.first] = kv.second;
    cfg_opts.swap(discovered);
    if (config_file.empty())
        config_file = *found;
}
