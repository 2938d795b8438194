// options/logging.cpp
//
// Parse log file, level, rotation and syslog settings.

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_options(Options& opts, const ArgParser& parser, const ConfigFlag& cfg_flag,
                           const ConfigOpt& cfg_opt,
                           const std::map<std::string, std::string>& cfg_opts) {
    bool ok = false;
    if (parser.has_flag("--log-file") || cfg_opts.count("--log-file")) {
        std::string val = parser.get_option("--log-file");
        if (val.empty())
            val = cfg_opt("--log-file");
        if (val.empty())
            throw std::runtime_error("--log-file requires a path");
        opts.logging.log_file = val;
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (parser.has_flag("--log-level") || cfg_opts.count("--log-level")) {
        std::string val = parser.get_option("--log-level");
        if (val.empty())
            val = cfg_opt("--log-level");
        if (val.empty())
            throw std::runtime_error("--log-level requires a value");
        auto level = parse_log_level(val);
        if (!level)
            throw std::runtime_error("Invalid log level: " + val);
        opts.logging.log_level = *level;
    }
    if (parser.has_flag("--max-log-size") || cfg_opts.count("--max-log-size")) {
        std::string val = parser.get_option("--max-log-size");
        if (val.empty())
            val = cfg_opt("--max-log-size");
        opts.logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (parser.has_flag("--max-log-files") || cfg_opts.count("--max-log-files")) {
        std::string val = parser.get_option("--max-log-files");
        if (val.empty())
            val = cfg_opt("--max-log-files");
        opts.logging.max_log_files = parse_size_t(val, 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    opts.logging.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    if (parser.has_flag("--syslog-facility") || cfg_opts.count("--syslog-facility")) {
        std::string val = parser.get_option("--syslog-facility");
        if (val.empty())
            val = cfg_opt("--syslog-facility");
        auto fac = parse_syslog_facility(val);
        if (!fac)
            throw std::runtime_error("Invalid value for --syslog-facility: " + val);
        opts.logging.syslog_facility = *fac;
    }
}
