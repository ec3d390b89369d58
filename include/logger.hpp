#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/** Structured key/value context attached to a log entry. */
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending, creating its parent directory
 * when needed, and configures rotation. Messages logged before this call are
 * dropped.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Parse a level name such as "debug" or "WARNING".
 *
 * @return The level, or `std::nullopt` for an unknown name.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with the specified severity and optional fields.
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const LogFields& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const LogFields& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const LogFields& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Mirror log entries to syslog using the specified facility.
 *
 * Has no effect on platforms without syslog support.
 */
void init_syslog(int facility = 0);

/**
 * @brief Flush and close the log file and detach from syslog.
 */
void shutdown_logger();

#endif // LOGGER_HPP
