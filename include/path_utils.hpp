#ifndef PATH_UTILS_HPP
#define PATH_UTILS_HPP
#include <filesystem>
#include <string>

/**
 * @brief Home directory of the current user.
 *
 * Taken from @c HOME, falling back to the password database. Returns an empty
 * path when neither source yields a directory.
 */
std::filesystem::path home_dir();

/**
 * @brief Per-user configuration directory.
 *
 * @c XDG_CONFIG_HOME when set and non-empty, otherwise `~/.config`. Empty when
 * no home directory is known.
 */
std::filesystem::path config_dir();

/**
 * @brief Expand a leading `~` and any `$VAR` or `${VAR}` references.
 *
 * `~` and `~/...` are replaced by the home directory. Environment variable
 * references are substituted with their values; references to unset variables
 * are left in place verbatim.
 *
 * @param path Path as written by the user.
 * @return The expanded path.
 */
std::filesystem::path expand_path(const std::string& path);

#endif // PATH_UTILS_HPP
