#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Small command line parser for long and short options.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Only the
 * options listed in @a value_flags consume the following argument, so a switch
 * such as `--dry-run` never swallows the positional repository path after it.
 * Short options (`-n`, `-d 30`, `-d30`) are mapped to their long names through
 * @a short_map and may be bundled (`-ns`) when they take no value. Everything
 * after a bare `--` is positional.
 *
 * Flags missing from a non-empty @a known_flags set are collected in
 * unknown_flags() instead of being recorded.
 */
class ArgParser {
    std::set<std::string> flags_;
    std::map<std::string, std::string> options_;
    std::map<std::string, std::vector<std::string>> multi_options_; ///< Every value, in order
    std::vector<std::string> positional_;
    std::vector<std::string> unknown_flags_;
    std::set<std::string> known_flags_;
    std::map<char, std::string> short_map_;
    std::set<std::string> value_flags_;

    bool accepts(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void record(const std::string& key, const std::string* value) {
        if (!accepts(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value) {
            options_[key] = *value;
            multi_options_[key].push_back(*value);
        }
    }

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted long flags; empty accepts everything.
     * @param short_map   Single character aliases for long flags.
     * @param value_flags Long flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    record(arg.substr(0, eq), &val);
                } else if (value_flags_.count(arg)) {
                    std::string val;
                    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0)
                        val = argv[++i];
                    record(arg, &val);
                } else {
                    record(arg, nullptr);
                }
                continue;
            }
            if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                for (size_t j = 1; j < arg.size(); ++j) {
                    auto it = short_map_.find(arg[j]);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back(std::string("-") + arg[j]);
                        break;
                    }
                    const std::string& key = it->second;
                    if (!value_flags_.count(key)) {
                        record(key, nullptr);
                        continue;
                    }
                    std::string val = arg.substr(j + 1);
                    if (!val.empty() && val[0] == '=')
                        val.erase(0, 1);
                    if (val.empty() && i + 1 < argc && argv[i + 1][0] != '-')
                        val = argv[++i];
                    record(key, &val);
                    break;
                }
                continue;
            }
            positional_.push_back(arg);
        }
    }

    /** @return `true` if @p flag (with leading `--`) was given. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Last value given for @p opt, or an empty string.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Every value given for a repeatable option, in order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
