#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load option values from a YAML file.
 *
 * Top-level scalars become `--<key>` entries in @p opts. A top-level map is
 * treated as a section (for example `logging:`) whose scalar children are
 * flattened the same way; deeper nesting and sequences are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--<key>`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the file was read and its root is a map.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load option values from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config with a JSON object at the root.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
