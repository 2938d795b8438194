#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <thread>
#include <future>
#include <nlohmann/json.hpp>
#include "test_common.hpp"
#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
        set_log_level(LogLevel::INFO);
    }
};

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream ifs(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "sb_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
    fs::remove(log3);

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    REQUIRE(std::filesystem::exists(log));
    REQUIRE(std::filesystem::exists(log1));
    REQUIRE(std::filesystem::exists(log2));
    REQUIRE_FALSE(std::filesystem::exists(log3));

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "sb_logger_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";
    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);

    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(std::filesystem::exists(log));
    REQUIRE(std::filesystem::exists(log1));
    REQUIRE(std::filesystem::exists(log2));

    gzFile zf = gzopen(log1.string().c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    fs::remove(log);
    fs::remove(log1);
    fs::remove(log2);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path log = fs::temp_directory_path() / "sb_logger_format.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("json entry", {{"branch", "feature-x"}});
    set_json_logging(false);
    log_info("plain entry", {{"branch", "feature-y"}});
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    auto entry = nlohmann::json::parse(lines[0]);
    REQUIRE(entry["msg"] == "json entry");
    REQUIRE(entry["level"] == "INFO");
    REQUIRE(entry["branch"] == "feature-x");
    REQUIRE(lines[1].find("[INFO] plain entry branch=feature-y") != std::string::npos);

    fs::remove(log);
}

TEST_CASE("Logger drops entries below the minimum level") {
    fs::path log = fs::temp_directory_path() / "sb_logger_level.log";
    fs::remove(log);
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown warning", {{"branch", "feature-x"}});
    log_error("shown error");
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("[WARNING] shown warning branch=feature-x") != std::string::npos);
    REQUIRE(lines[1].find("[ERROR] shown error") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("parse_log_level accepts names case-insensitively") {
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("INFO") == LogLevel::INFO);
    REQUIRE(parse_log_level("Warn") == LogLevel::WARNING);
    REQUIRE(parse_log_level("warning") == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR") == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("parse_syslog_facility maps names and numbers to facility codes") {
    REQUIRE(parse_syslog_facility("user") == (1 << 3));
    REQUIRE(parse_syslog_facility("DAEMON") == (3 << 3));
    REQUIRE(parse_syslog_facility("local0") == (16 << 3));
    REQUIRE(parse_syslog_facility("local7") == (23 << 3));
    REQUIRE(parse_syslog_facility("1") == (1 << 3));
    REQUIRE(parse_syslog_facility("23") == (23 << 3));
    REQUIRE_FALSE(parse_syslog_facility("24").has_value());
    REQUIRE_FALSE(parse_syslog_facility("local8").has_value());
    REQUIRE_FALSE(parse_syslog_facility("-1").has_value());
    REQUIRE_FALSE(parse_syslog_facility("").has_value());
#ifdef __linux__
    REQUIRE(parse_syslog_facility("user") == LOG_USER);
    REQUIRE(parse_syslog_facility("local3") == LOG_LOCAL3);
#endif
}

TEST_CASE("Logging after shutdown writes nothing") {
    fs::path log = fs::temp_directory_path() / "sb_logger_closed.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    shutdown_logger();
    REQUIRE_NOTHROW(log_info("nowhere to go"));
    REQUIRE_NOTHROW(log_error("still nowhere"));
    REQUIRE(fs::exists(log));
    REQUIRE(fs::file_size(log) == 0);
    fs::remove(log);
}

TEST_CASE("init_logger can be called twice") {
    fs::path log = fs::temp_directory_path() / "sb_logger_reinit.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    log_info("first entry");
    init_logger(log.string());
    log_info("second entry");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    fs::remove(log);
}

TEST_CASE("init_logger keeps the previous file on failed reopen") {
    fs::path log = fs::temp_directory_path() / "sb_logger_fail_reinit.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    log_info("before");
    fs::path bad = log.parent_path() / "sb_missing_dir" / "logger.log";
    init_logger(bad.string());
    log_info("after");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find("after") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("Concurrent writers do not interleave lines") {
    fs::path log = fs::temp_directory_path() / "sb_logger_threads.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    std::promise<void> go;
    auto ready = go.get_future().share();
    auto writer = [&](const std::string& tag) {
        ready.wait();
        for (int i = 0; i < 100; ++i)
            log_info(tag + " " + std::to_string(i));
    };
    std::thread t1(writer, "alpha");
    std::thread t2(writer, "beta");
    go.set_value();
    t1.join();
    t2.join();
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 200);
    for (const auto& l : lines)
        REQUIRE(l.find("[INFO] ") != std::string::npos);
    fs::remove(log);
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    fs::path log = fs::temp_directory_path() / "sb_logger_syslog.log";
    fs::remove(log);
    g_syslog_messages.clear();
    init_logger(log.string());
    LoggerGuard guard;
    init_syslog(LOG_USER);
    log_info("syslog entry");
    shutdown_logger();
    REQUIRE_FALSE(g_syslog_messages.empty());
    REQUIRE(g_syslog_messages.back().find("syslog entry") != std::string::npos);
    fs::remove(log);
}
#endif
