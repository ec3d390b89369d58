#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <cstdint>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format an uptime in seconds as "1h 2m 3s".
 *
 * Leading zero units are dropped, so 65 becomes "1m 5s" and 5 becomes "5s".
 */
std::string format_uptime(std::uint64_t running_secs);

#endif // TIME_UTILS_HPP
