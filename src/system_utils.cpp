#include "system_utils.hpp"
#include <climits>
#include <system_error>
#include <vector>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace procutil {

std::uint64_t clock_ticks_per_sec() {
    long ticks = sysconf(_SC_CLK_TCK);
    if (ticks <= 0)
        return 100;
    return static_cast<std::uint64_t>(ticks);
}

std::uint32_t current_uid() { return static_cast<std::uint32_t>(getuid()); }

fs::path current_executable() {
    std::error_code ec;
#ifdef __linux__
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        return {};
    return exe;
#elif defined(__APPLE__)
    uint32_t size = PATH_MAX;
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) {
        buf.assign(size + 1, '\0');
        if (_NSGetExecutablePath(buf.data(), &size) != 0)
            return {};
    }
    fs::path exe = fs::canonical(buf.data(), ec);
    if (ec)
        return fs::path(buf.data());
    return exe;
#else
    return {};
#endif
}

} // namespace procutil
