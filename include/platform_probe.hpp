#ifndef PLATFORM_PROBE_HPP
#define PLATFORM_PROBE_HPP
#include <string>
#include "command_runner.hpp"

namespace autostart {

/** Service registration mechanisms known to the registrar. */
enum class AutostartPlatform {
    MacServiceAgent,       ///< launchd agent in ~/Library/LaunchAgents
    LinuxSystemdUser,      ///< unit for the per-user systemd instance
    LinuxDesktopAutostart, ///< XDG autostart desktop entry
    Unsupported,
};

/**
 * @brief Select the registration mechanism for this host.
 *
 * macOS always uses a launch agent. On Linux the user-level systemd instance
 * is preferred when `systemctl --user --version` succeeds, otherwise the XDG
 * autostart directory is used. Every other OS is unsupported. Availability
 * can change between invocations so the answer is never cached.
 */
AutostartPlatform detect_platform(const procutil::CommandRunner& runner);

/** @brief True when a user-level systemd instance answers a version probe. */
bool systemd_user_available(const procutil::CommandRunner& runner);

/** @brief Short identifier such as "systemd" or "launchd". */
std::string platform_name(AutostartPlatform platform);

} // namespace autostart

#endif // PLATFORM_PROBE_HPP
