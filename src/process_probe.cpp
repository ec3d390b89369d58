#include "process_probe.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <sys/types.h>
#include <vector>

namespace fs = std::filesystem;

namespace procutil {

bool pid_in_range(long pid) {
    return pid > 0 && pid <= static_cast<long>(std::numeric_limits<pid_t>::max());
}

bool process_is_running(long pid) {
    if (!pid_in_range(pid))
        return false;
    return kill(static_cast<pid_t>(pid), 0) == 0;
}

bool signal_process(long pid, int sig) {
    if (!pid_in_range(pid))
        return false;
    return kill(static_cast<pid_t>(pid), sig) == 0;
}

bool terminate_process(long pid) { return signal_process(pid, SIGTERM); }

bool wait_for_exit(long pid, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (process_is_running(pid)) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

#ifdef __linux__
namespace {

// Field 22 of /proc/<pid>/stat (index 21). Counted after the closing
// parenthesis of the command name, which may itself contain spaces.
std::optional<unsigned long long> read_start_ticks(const fs::path& stat_path) {
    std::ifstream in(stat_path);
    if (!in.is_open())
        return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto close = content.rfind(')');
    if (close == std::string::npos)
        return std::nullopt;
    std::istringstream rest(content.substr(close + 1));
    std::vector<std::string> fields;
    std::string tok;
    while (rest >> tok)
        fields.push_back(tok);
    constexpr size_t START_INDEX = 21 - 2;
    if (fields.size() <= START_INDEX)
        return std::nullopt;
    std::istringstream num(fields[START_INDEX]);
    unsigned long long ticks = 0;
    if (!(num >> ticks) || !num.eof())
        return std::nullopt;
    return ticks;
}

std::optional<double> read_system_uptime(const fs::path& uptime_path) {
    std::ifstream in(uptime_path);
    if (!in.is_open())
        return std::nullopt;
    double secs = 0.0;
    if (!(in >> secs) || secs < 0.0)
        return std::nullopt;
    return secs;
}

} // namespace

std::optional<unsigned long long> process_uptime_seconds(long pid, const fs::path& proc_root) {
    if (pid <= 0)
        return std::nullopt;
    auto start_ticks = read_start_ticks(proc_root / std::to_string(pid) / "stat");
    if (!start_ticks)
        return std::nullopt;
    auto uptime = read_system_uptime(proc_root / "uptime");
    if (!uptime)
        return std::nullopt;
    unsigned long long start_secs = *start_ticks / clock_ticks_per_sec();
    auto system_secs = static_cast<unsigned long long>(std::floor(*uptime));
    if (start_secs > system_secs)
        return std::nullopt;
    return system_secs - start_secs;
}
#else
std::optional<unsigned long long> process_uptime_seconds(long, const fs::path&) {
    return std::nullopt;
}
#endif

std::optional<std::string> read_process_uptime(long pid, const fs::path& proc_root) {
    auto secs = process_uptime_seconds(pid, proc_root);
    if (!secs)
        return std::nullopt;
    return format_uptime(*secs);
}

} // namespace procutil
