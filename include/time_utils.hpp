#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <ctime>
#include <optional>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format @p t as an ISO-8601 UTC string like 2024-01-15T10:30:00Z.
 */
std::string format_iso_utc(std::time_t t);

/**
 * @brief Render @p t in git's `%ai` layout for the given UTC offset.
 *
 * @param t              Seconds since the epoch.
 * @param offset_minutes Offset east of UTC in minutes.
 * @return String such as `2024-01-15 10:30:00 +0100`.
 */
std::string format_commit_timestamp(std::time_t t, int offset_minutes);

/**
 * @brief Parse a commit timestamp in git's `%ai` layout.
 *
 * Accepts `YYYY-MM-DD HH:MM:SS` optionally followed by a `+HHMM`/`-HHMM`
 * offset. Without an offset the value is read as UTC. Leading and trailing
 * whitespace is ignored.
 *
 * @return Seconds since the epoch or `std::nullopt` when the text does not
 *         match the layout.
 */
std::optional<std::time_t> parse_commit_timestamp(const std::string& text);

/**
 * @brief Whole days elapsed between @p then and @p now.
 *
 * Partial days are truncated. Timestamps in the future yield 0.
 */
int whole_days_between(std::time_t then, std::time_t now);

#endif // TIME_UTILS_HPP
