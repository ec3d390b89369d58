#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include "logger.hpp"

enum class Command {
    None,
    Run,
    Start,
    Stop,
    Restart,
    Reload,
    Status,
    Autostart,
    Update,
    Version,
    Help
};

enum class AutostartAction { Status, Enable, Disable, Toggle };

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::filesystem::path log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool compress_logs = false;
    bool json_log = false;
    bool use_syslog = false;
};

struct Options {
    Command command = Command::None;
    AutostartAction autostart_action = AutostartAction::Status;
    std::filesystem::path config_file;
    std::filesystem::path pid_file;
    LoggingOptions logging;
    std::chrono::milliseconds update_timeout{5000};
    bool check_only = false;
    bool foreground = false;
};

/**
 * @brief Build the effective options from the command line and settings file.
 *
 * The settings file is `--config <file>` when given, otherwise the default
 * file from default_config_file() if one exists. Command line values take
 * precedence over file values; `HAZELNUT_LOG` supplies the log level when
 * neither sets it.
 *
 * @throws std::runtime_error on unknown flags, missing or invalid values,
 *         unknown commands, or an unreadable settings file.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
