#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <cstdint>
#include <filesystem>
#include <unistd.h>

namespace procutil {

/**
 * @brief Number of kernel clock ticks per second.
 *
 * Used to convert process start times from /proc into seconds.
 */
std::uint64_t clock_ticks_per_sec();

/** @brief Real user id of the calling process. */
std::uint32_t current_uid();

/**
 * @brief Absolute path of the running executable.
 *
 * Resolved through /proc/self/exe on Linux and _NSGetExecutablePath on macOS.
 * Returns an empty path when the location cannot be determined.
 */
std::filesystem::path current_executable();

/** Owns a file descriptor and closes it on destruction. */
class UniqueFd {
  public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    /** Close the held descriptor, if any, and take ownership of @p fd. */
    void reset(int fd = -1) {
        if (fd_ >= 0)
            close(fd_);
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
