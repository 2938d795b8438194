#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim_copy(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); })
                 .base();
    return b < e ? std::string(b, e) : std::string();
}

bool only_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    const std::string v = trim_copy(value);
    if (v.empty())
        return 0;
    size_t start = (v[0] == '+' || v[0] == '-') ? 1 : 0;
    if (!only_digits(v.substr(start)))
        return 0;
    long long n = 0;
    try {
        n = std::stoll(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (n < min || n > max)
        return 0;
    ok = true;
    return static_cast<int>(n);
}

int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_int(parser.get_option(flag), min, max, ok);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    const std::string v = trim_copy(value);
    if (!only_digits(v))
        return 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (n < min || n > max)
        return 0;
    ok = true;
    return static_cast<size_t>(n);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = trim_copy(value);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    unsigned long long mult = 1;
    static const std::pair<const char*, unsigned long long> units[] = {
        {"kb", 1024ull},
        {"mb", 1024ull * 1024},
        {"gb", 1024ull * 1024 * 1024},
        {"tb", 1024ull * 1024 * 1024 * 1024},
        {"k", 1024ull},
        {"m", 1024ull * 1024},
        {"g", 1024ull * 1024 * 1024},
        {"t", 1024ull * 1024 * 1024 * 1024},
        {"b", 1ull},
    };
    for (const auto& [suffix, factor] : units) {
        if (ends_with(suffix)) {
            mult = factor;
            val.erase(val.size() - std::char_traits<char>::length(suffix));
            break;
        }
    }
    if (!only_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_switch(const std::string& value) {
    std::string v = trim_copy(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v.empty() || v == "1" || v == "true" || v == "yes" || v == "on";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}
