#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "branch_inspector.hpp"
#include "logger.hpp"
#include "staleness.hpp"
#include "vcs_backend.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0; ///< `openlog` facility code; 0 means LOG_USER
};

struct Options {
    std::filesystem::path repo = ".";
    std::string trunk = "main";
    int days = DEFAULT_STALE_DAYS;
    bool dry_run = false;
    std::filesystem::path output_file;
    std::filesystem::path summary_json;
    /// Effective protected set: defaults (unless disabled), --protect,
    /// --protect-file entries and the trunk itself.
    std::set<std::string> protected_names;
    std::vector<std::string> protected_patterns;
    std::vector<std::string> branch_patterns;
    MergeMatchMode merge_match = MergeMatchMode::Exact;
    bool strict_merge_check = false;
    bool require_clean = false;
    vcs::BackendKind backend = vcs::BackendKind::Libgit2;
    bool silent = false;
    LoggingOptions logging;
    bool auto_config = false;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Parse command-line arguments and configuration files into an Options
 * instance.
 *
 * Configuration files are read first; command line values override them.
 *
 * @throws std::runtime_error for unknown flags, invalid values or unreadable
 *         configuration files.
 */
Options parse_options(int argc, char* argv[]);

/// Long flags that take a value.
const std::set<std::string>& option_value_flags();

/// Single character aliases for long flags.
const std::map<char, std::string>& option_short_map();

class ArgParser;

using ConfigFlag = std::function<bool(const std::string&)>;
using ConfigOpt = std::function<std::string(const std::string&)>;

/**
 * Load `--config-yaml`, `--config-json` and `--auto-config` files.
 *
 * @param cfg_opts    Receives option values keyed by `--flag`.
 * @param config_file Receives the path of the last file loaded.
 */
void load_config_and_auto(int argc, char* argv[], std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/**
 * Parse `--log-*`, `--json-log`, `--compress-logs` and syslog settings.
 */
void parse_logging_options(Options& opts, const ArgParser& parser, const ConfigFlag& cfg_flag,
                           const ConfigOpt& cfg_opt,
                           const std::map<std::string, std::string>& cfg_opts);

/**
 * Parse the protection, filtering and merge-check settings.
 */
void parse_cleanup_options(Options& opts, const ArgParser& parser, const ConfigFlag& cfg_flag,
                           const ConfigOpt& cfg_opt,
                           const std::map<std::string, std::string>& cfg_opts);

#endif // OPTIONS_HPP
