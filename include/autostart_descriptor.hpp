#ifndef AUTOSTART_DESCRIPTOR_HPP
#define AUTOSTART_DESCRIPTOR_HPP
#include <filesystem>
#include <optional>
#include <string>
#include "platform_probe.hpp"

namespace autostart {

/** launchd label of the agent. */
inline constexpr const char* LAUNCH_AGENT_LABEL = "me.ricardodantas.hazelnutd";
/** Subcommand that runs the daemon in the foreground. */
inline constexpr const char* RUN_SUBCOMMAND = "run";

/**
 * Where and what to write for one platform. Computed fresh for each
 * registrar call and never persisted.
 */
struct AutostartTarget {
    AutostartPlatform platform = AutostartPlatform::Unsupported;
    std::filesystem::path descriptor_path;
    std::string descriptor_content;
};

/**
 * @brief Location of the descriptor file for @p platform.
 *
 * Derived from the home and configuration directories of the current user.
 *
 * @return The path, or `std::nullopt` for an unsupported platform or when no
 *         home directory is known.
 */
std::optional<std::filesystem::path> descriptor_path(AutostartPlatform platform);

/**
 * @brief Render the descriptor text for @p platform.
 *
 * @param binary Absolute path of the daemon executable.
 * @return The file contents, empty for an unsupported platform.
 */
std::string render_descriptor(AutostartPlatform platform, const std::filesystem::path& binary);

std::string render_launch_agent(const std::filesystem::path& binary);
std::string render_systemd_unit(const std::filesystem::path& binary);
std::string render_desktop_entry(const std::filesystem::path& binary);

} // namespace autostart

#endif // AUTOSTART_DESCRIPTOR_HPP
