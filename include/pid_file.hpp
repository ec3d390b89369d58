#ifndef PID_FILE_HPP
#define PID_FILE_HPP
#include <filesystem>
#include <string>

namespace procutil {

/**
 * @brief Default location of the daemon pid file.
 *
 * `$XDG_RUNTIME_DIR/hazelnutd.pid` when the runtime directory is set,
 * otherwise `/tmp/hazelnutd-<uid>.pid`.
 */
std::filesystem::path default_pid_file();

/**
 * @brief Create the pid file exclusively and write the current PID into it.
 *
 * A pre-existing file whose recorded process is no longer running is treated
 * as stale and replaced.
 *
 * @param path  Filesystem location of the pid file.
 * @param error Receives a human-readable reason on failure.
 * @return `true` if this process now owns the file.
 */
bool acquire_pid_file(const std::filesystem::path& path, std::string& error);

/**
 * @brief Delete the pid file at @p path if present.
 */
void release_pid_file(const std::filesystem::path& path);

/**
 * @brief Read the PID stored in a pid file.
 *
 * @param path Path to the pid file.
 * @param pid  Output variable receiving the parsed process ID.
 * @return `true` if a PID valid for this platform was read.
 */
bool read_pid_file(const std::filesystem::path& path, long& pid);

/**
 * @brief RAII guard that owns the pid file for its lifetime.
 */
struct PidFileGuard {
    std::filesystem::path path; ///< Location of the pid file.
    bool locked = false;        ///< Whether the file was acquired.
    std::string error;          ///< Reason when not acquired.
    explicit PidFileGuard(const std::filesystem::path& p);
    ~PidFileGuard();
    PidFileGuard(const PidFileGuard&) = delete;
    PidFileGuard& operator=(const PidFileGuard&) = delete;
};

} // namespace procutil

#endif // PID_FILE_HPP
