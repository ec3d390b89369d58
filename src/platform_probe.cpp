#include "platform_probe.hpp"
#include "logger.hpp"

namespace autostart {

bool systemd_user_available(const procutil::CommandRunner& runner) {
    if (!runner)
        return false;
    return runner({"systemctl", "--user", "--version"}).success();
}

AutostartPlatform detect_platform(const procutil::CommandRunner& runner) {
#if defined(__APPLE__)
    (void)runner;
    return AutostartPlatform::MacServiceAgent;
#elif defined(__linux__)
    if (systemd_user_available(runner))
        return AutostartPlatform::LinuxSystemdUser;
    log_debug("systemd user instance unavailable, using XDG autostart");
    return AutostartPlatform::LinuxDesktopAutostart;
#else
    (void)runner;
    return AutostartPlatform::Unsupported;
#endif
}

std::string platform_name(AutostartPlatform platform) {
    switch (platform) {
    case AutostartPlatform::MacServiceAgent:
        return "launchd";
    case AutostartPlatform::LinuxSystemdUser:
        return "systemd";
    case AutostartPlatform::LinuxDesktopAutostart:
        return "xdg-autostart";
    case AutostartPlatform::Unsupported:
        return "unsupported";
    }
    return "unsupported";
}

} // namespace autostart
