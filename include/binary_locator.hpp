#ifndef BINARY_LOCATOR_HPP
#define BINARY_LOCATOR_HPP
#include <filesystem>
#include <optional>
#include "command_runner.hpp"

namespace procutil {

/** Executable name of the daemon. */
inline constexpr const char* DAEMON_BINARY_NAME = "hazelnutd";

/**
 * @brief Resolve the absolute path of the daemon executable.
 *
 * Tries, in order: `which hazelnutd` through @p runner, the common system
 * install directories, then `~/.cargo/bin`. Service managers run with a
 * minimal environment, so callers must embed the returned absolute path
 * rather than the bare command name.
 *
 * @return The path, or `std::nullopt` when the binary cannot be found.
 */
std::optional<std::filesystem::path> locate_daemon_binary(const CommandRunner& runner);

} // namespace procutil

#endif // BINARY_LOCATOR_HPP
