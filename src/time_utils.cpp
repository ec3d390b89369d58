#include "time_utils.hpp"
#include <chrono>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_uptime(std::uint64_t running_secs) {
    std::uint64_t hours = running_secs / 3600;
    std::uint64_t mins = (running_secs % 3600) / 60;
    std::uint64_t secs = running_secs % 60;
    if (hours > 0)
        return std::to_string(hours) + "h " + std::to_string(mins) + "m " + std::to_string(secs) +
               "s";
    if (mins > 0)
        return std::to_string(mins) + "m " + std::to_string(secs) + "s";
    return std::to_string(secs) + "s";
}
