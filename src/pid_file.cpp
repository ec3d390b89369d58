#include "pid_file.hpp"
#include "process_probe.hpp"
#include "system_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace procutil {

fs::path default_pid_file() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime)
        return fs::path(runtime) / "hazelnutd.pid";
    return fs::temp_directory_path() / ("hazelnutd-" + std::to_string(current_uid()) + ".pid");
}

static bool create_exclusive(const fs::path& path, std::string& error) {
    UniqueFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644));
    if (!fd) {
        error = std::strerror(errno);
        return false;
    }
    char buf[32];
    int len = std::snprintf(buf, sizeof(buf), "%ld\n", static_cast<long>(getpid()));
    if (len <= 0 || write(fd.get(), buf, static_cast<size_t>(len)) != len) {
        error = "Failed to write pid file";
        fd.reset();
        std::error_code ec;
        fs::remove(path, ec);
        return false;
    }
    return true;
}

bool acquire_pid_file(const fs::path& path, std::string& error) {
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);
    if (create_exclusive(path, error))
        return true;
    long pid = 0;
    if (read_pid_file(path, pid) && process_is_running(pid)) {
        error = "Another instance is already running (PID " + std::to_string(pid) + ")";
        return false;
    }
    fs::remove(path, ec);
    if (ec) {
        error = "Failed to remove stale pid file: " + ec.message();
        return false;
    }
    return create_exclusive(path, error);
}

void release_pid_file(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

bool read_pid_file(const fs::path& path, long& pid) {
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    long value = 0;
    if (!(f >> value) || !pid_in_range(value))
        return false;
    pid = value;
    return true;
}

PidFileGuard::PidFileGuard(const fs::path& p) : path(p) { locked = acquire_pid_file(path, error); }

PidFileGuard::~PidFileGuard() {
    if (locked)
        release_pid_file(path);
}

} // namespace procutil
