#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Load option values from a YAML file.
 *
 * Top-level keys map to long flags (`days: 45` becomes `--days` = `45`).
 * Nested maps are flattened into the same namespace, so keys may be grouped
 * under sections such as `logging:`. Sequences of scalars are joined into a
 * comma separated list.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--flag`.
 * @param error Human-readable error message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load option values from a JSON file.
 *
 * Same key mapping as load_yaml_config().
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/// File names probed by find_auto_config(), in order.
const std::vector<std::string>& auto_config_names();

/**
 * @brief Find the first configuration file in @p dirs.
 *
 * Each directory is checked for every name in auto_config_names() before
 * moving on to the next directory.
 */
std::optional<std::filesystem::path>
find_auto_config(const std::vector<std::filesystem::path>& dirs);

#endif // CONFIG_UTILS_HPP
