#include "time_utils.hpp"
#include <chrono>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace {

std::time_t utc_to_time_t(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

bool to_utc_tm(std::time_t t, std::tm& tm) {
#ifdef _WIN32
    return gmtime_s(&tm, &t) == 0;
#else
    return gmtime_r(&t, &tm) != nullptr;
#endif
}

std::string trim_copy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool all_digits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size())
        return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

int to_int(const std::string& s, size_t pos, size_t len) { return std::stoi(s.substr(pos, len)); }

} // namespace

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_iso_utc(std::time_t t) {
    std::tm tm{};
    if (!to_utc_tm(t, tm))
        return "";
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

std::string format_commit_timestamp(std::time_t t, int offset_minutes) {
    std::tm tm{};
    if (!to_utc_tm(t + static_cast<std::time_t>(offset_minutes) * 60, tm))
        return "";
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    int off = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    char zone[8];
    std::snprintf(zone, sizeof(zone), "%c%02d%02d", offset_minutes < 0 ? '-' : '+', off / 60,
                  off % 60);
    return std::string(buf) + " " + zone;
}

std::optional<std::time_t> parse_commit_timestamp(const std::string& text) {
    const std::string s = trim_copy(text);
    // YYYY-MM-DD HH:MM:SS
    if (s.size() < 19 || !all_digits(s, 0, 4) || s[4] != '-' || !all_digits(s, 5, 2) ||
        s[7] != '-' || !all_digits(s, 8, 2) || (s[10] != ' ' && s[10] != 'T') ||
        !all_digits(s, 11, 2) || s[13] != ':' || !all_digits(s, 14, 2) || s[16] != ':' ||
        !all_digits(s, 17, 2))
        return std::nullopt;
    std::tm tm{};
    tm.tm_year = to_int(s, 0, 4) - 1900;
    tm.tm_mon = to_int(s, 5, 2) - 1;
    tm.tm_mday = to_int(s, 8, 2);
    tm.tm_hour = to_int(s, 11, 2);
    tm.tm_min = to_int(s, 14, 2);
    tm.tm_sec = to_int(s, 17, 2);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
        return std::nullopt;

    long offset_sec = 0;
    std::string rest = trim_copy(s.substr(19));
    if (!rest.empty()) {
        if (rest.size() != 5 || (rest[0] != '+' && rest[0] != '-') || !all_digits(rest, 1, 4))
            return std::nullopt;
        int hh = to_int(rest, 1, 2);
        int mm = to_int(rest, 3, 2);
        if (mm > 59)
            return std::nullopt;
        offset_sec = (hh * 3600L + mm * 60L) * (rest[0] == '-' ? -1 : 1);
    }
    std::time_t t = utc_to_time_t(tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return t - offset_sec;
}

int whole_days_between(std::time_t then, std::time_t now) {
    if (now <= then)
        return 0;
    return static_cast<int>((now - then) / 86400);
}
