#include "help_text.hpp"
#include <iomanip>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

struct CommandInfo {
    const char* usage;
    const char* desc;
};

void print_help(const char* prog, std::ostream& out) {
    static const std::vector<CommandInfo> commands = {
        {"run", "Run the daemon in the foreground"},
        {"start", "Start the daemon in the background (--foreground to stay attached)"},
        {"stop", "Stop the running daemon"},
        {"restart", "Stop the running daemon, then start it again"},
        {"reload", "Ask the running daemon to reload its configuration"},
        {"status", "Show whether the daemon is running and its uptime"},
        {"autostart [enable|disable|toggle|status]", "Manage start at login"},
        {"update", "Check for a newer release and install it"},
        {"version", "Print the version"},
    };
    static const std::vector<OptionInfo> opts = {
        {"--config", "-c", "<file>", "Load settings from a YAML or JSON file", "Basics"},
        {"--foreground", "-f", "", "Do not detach when starting", "Basics"},
        {"--pid-file", "", "<path>", "Location of the pid file", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print the version", "Basics"},
        {"--check-only", "", "", "Only report whether an update exists", "Update"},
        {"--timeout", "-t", "<sec|ms>", "Update check timeout (default 5s)", "Update"},
        {"--log-file", "", "<path>", "Write logs to this file", "Logging"},
        {"--log-level", "", "<level>", "debug, info, warning or error", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--syslog", "", "", "Mirror log entries to syslog", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file above this size", "Logging"},
        {"--log-files", "", "<n>", "Number of rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
    };

    out << "Usage: " << prog << " [options] <command>\n\n";
    out << "Commands:\n";
    for (const auto& c : commands)
        out << "  " << std::left << std::setw(44) << c.usage << c.desc << "\n";

    std::vector<std::string> categories;
    for (const auto& o : opts) {
        bool seen = false;
        for (const auto& c : categories)
            seen = seen || c == o.category;
        if (!seen)
            categories.emplace_back(o.category);
    }
    for (const auto& cat : categories) {
        out << "\n" << cat << ":\n";
        for (const auto& o : opts) {
            if (cat != o.category)
                continue;
            std::string flag = std::string(o.long_flag);
            if (*o.short_flag)
                flag = std::string(o.short_flag) + ", " + flag;
            if (*o.arg)
                flag += std::string(" ") + o.arg;
            out << "  " << std::left << std::setw(30) << flag << o.desc << "\n";
        }
    }
    out << "\nEnvironment:\n  HAZELNUT_LOG                  Default log level\n";
}
