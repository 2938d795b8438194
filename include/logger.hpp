#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Open the log file and configure rotation.
 *
 * Entries are appended synchronously. When the file cannot be opened the
 * previous sink (if any) is kept and a message is printed to stderr.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

void set_log_level(LogLevel level);

/**
 * @brief Emit one JSON object per line instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated files (`app.log.1.gz`, ...).
 */
void set_log_compression(bool enable);

/**
 * @brief Map a level name (`debug`, `info`, `warning`/`warn`, `error`) to a
 *        @ref LogLevel. Case-insensitive.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * Plain text entries append the fields as ` key=value`; JSON entries add
 * them as string members.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Map a syslog facility name (`user`, `daemon`, `local0`..`local7`, ...)
 *        or facility number (0-23) to the code `openlog` expects.
 */
std::optional<int> parse_syslog_facility(const std::string& name);

/**
 * @brief Mirror every entry to syslog under the given facility.
 *
 * No-op on platforms without syslog.
 */
void init_syslog(int facility = 0);

/**
 * @brief Close the log file and syslog connection.
 */
void shutdown_logger();

#endif // LOGGER_HPP
