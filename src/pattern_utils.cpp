#include "pattern_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#ifdef _WIN32
#include <regex>
#else
#include <fnmatch.h>
#endif

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

#ifdef _WIN32
std::string glob_to_regex(const std::string& pattern) {
    std::string rx;
    rx.reserve(pattern.size() * 2);
    rx.push_back('^');
    for (char c : pattern) {
        if (c == '*') {
            rx += ".*";
        } else if (c == '?') {
            rx += ".";
        } else if (c == '.' || c == '\\' || c == '+' || c == '(' || c == ')' || c == '{' ||
                   c == '}' || c == '^' || c == '$' || c == '|') {
            rx.push_back('\\');
            rx.push_back(c);
        } else {
            rx.push_back(c);
        }
    }
    rx.push_back('$');
    return rx;
}
#endif

bool glob_match(const std::string& pattern, const std::string& name) {
#ifdef _WIN32
    try {
        return std::regex_match(name, std::regex(glob_to_regex(pattern)));
    } catch (const std::regex_error&) {
        return false;
    }
#else
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
#endif
}

} // namespace

namespace patterns {

std::vector<std::string> read_pattern_file(const std::filesystem::path& file) {
    std::vector<std::string> entries;
    std::ifstream ifs(file);
    if (!ifs)
        return entries;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.push_back(line);
    }
    return entries;
}

bool is_glob(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

bool matches(const std::string& name, const std::vector<std::string>& patterns) {
    for (const auto& pat : patterns) {
        if (!is_glob(pat)) {
            if (pat == name)
                return true;
            continue;
        }
        if (glob_match(pat, name))
            return true;
    }
    return false;
}

} // namespace patterns
