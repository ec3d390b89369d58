#ifndef PROCESS_PROBE_HPP
#define PROCESS_PROBE_HPP
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace procutil {

/**
 * @brief True when @p pid is positive and representable as a `pid_t`.
 *
 * Larger values would wrap when narrowed and could name an unrelated process.
 */
bool pid_in_range(long pid);

/**
 * @brief Check whether a process with the given PID exists.
 *
 * Sends signal 0, which performs only the existence and permission checks.
 * A `true` result means the process exists and may be signalled by the
 * calling user; it says nothing about its health. Non-positive PIDs are never
 * considered running, nor are PIDs outside the range of `pid_t`.
 */
bool process_is_running(long pid);

/**
 * @brief Send @p sig to the process.
 *
 * @return `true` if the signal was delivered; `false` for out of range PIDs.
 */
bool signal_process(long pid, int sig);

/**
 * @brief Ask the process to terminate with SIGTERM.
 *
 * @return `true` if the signal was delivered.
 */
bool terminate_process(long pid);

/**
 * @brief Poll until the process is gone or @p timeout elapses.
 *
 * @return `true` once process_is_running() reports `false`.
 */
bool wait_for_exit(long pid, std::chrono::milliseconds timeout);

/**
 * @brief Seconds the process has been running.
 *
 * Reads the start time in clock ticks from `<proc_root>/<pid>/stat` and the
 * system uptime from `<proc_root>/uptime`. Both are re-read on every call.
 *
 * @return Elapsed seconds, or `std::nullopt` when the information is not
 *         available on this platform or the files are missing or malformed.
 */
std::optional<unsigned long long>
process_uptime_seconds(long pid, const std::filesystem::path& proc_root = "/proc");

/**
 * @brief Human readable uptime of a process, e.g. "2h 3m 4s".
 *
 * @return The formatted uptime, or `std::nullopt` when unavailable.
 */
std::optional<std::string> read_process_uptime(long pid,
                                               const std::filesystem::path& proc_root = "/proc");

} // namespace procutil

#endif // PROCESS_PROBE_HPP
