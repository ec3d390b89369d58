#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <filesystem>
#include <map>
#include <string>

/**
 * @brief Load daemon settings from a YAML file.
 *
 * Top-level scalars become options keyed as `--name`. A mapping value is a
 * section: its scalar entries are added the same way, so
 * `logging: {log-level: debug}` and `log-level: debug` are equivalent.
 * Sequences are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load daemon settings from a JSON file.
 *
 * Same layout rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load a settings file, choosing the format from its extension.
 *
 * `.json` is parsed as JSON, anything else as YAML.
 */
bool load_config_file(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Location of the default settings file.
 *
 * `<config dir>/hazelnut/daemon.yaml`, or `daemon.json` when only that exists.
 * Returns an empty path when neither file is present.
 */
std::filesystem::path default_config_file();

#endif // CONFIG_UTILS_HPP
