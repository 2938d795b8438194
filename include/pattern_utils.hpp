#ifndef PATTERN_UTILS_HPP
#define PATTERN_UTILS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace patterns {

/**
 * @brief Read branch names or glob patterns from a file.
 *
 * One entry per line. Surrounding whitespace is trimmed; blank lines and lines
 * starting with `#` are skipped.
 *
 * @param file Path to the file.
 * @return Entries in file order. Empty if the file cannot be opened.
 */
std::vector<std::string> read_pattern_file(const std::filesystem::path& file);

/**
 * @brief Test a branch name against a set of patterns.
 *
 * Patterns without `*`, `?` or `[` must equal @p name exactly. Glob patterns
 * use shell wildcard rules where `*` also matches `/`, so `release/*` covers
 * `release/1.2/hotfix`.
 *
 * @return `true` if any pattern matches.
 */
bool matches(const std::string& name, const std::vector<std::string>& patterns);

/// `true` when @p pattern contains a glob metacharacter.
bool is_glob(const std::string& pattern);

} // namespace patterns

#endif // PATTERN_UTILS_HPP
