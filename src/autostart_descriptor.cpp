#include "autostart_descriptor.hpp"
#include "path_utils.hpp"
#include <sstream>

namespace fs = std::filesystem;

namespace autostart {

std::optional<fs::path> descriptor_path(AutostartPlatform platform) {
    fs::path home = home_dir();
    if (home.empty())
        return std::nullopt;
    switch (platform) {
    case AutostartPlatform::MacServiceAgent:
        return home / "Library" / "LaunchAgents" / (std::string(LAUNCH_AGENT_LABEL) + ".plist");
    case AutostartPlatform::LinuxSystemdUser:
        return home / ".config" / "systemd" / "user" / "hazelnutd.service";
    case AutostartPlatform::LinuxDesktopAutostart:
        return config_dir() / "autostart" / "hazelnutd.desktop";
    case AutostartPlatform::Unsupported:
        break;
    }
    return std::nullopt;
}

std::string render_launch_agent(const fs::path& binary) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";
    out << "<plist version=\"1.0\">\n<dict>\n";
    out << "    <key>Label</key>\n    <string>" << LAUNCH_AGENT_LABEL << "</string>\n";
    out << "    <key>ProgramArguments</key>\n    <array>\n";
    out << "        <string>" << binary.string() << "</string>\n";
    out << "        <string>" << RUN_SUBCOMMAND << "</string>\n";
    out << "    </array>\n";
    out << "    <key>RunAtLoad</key>\n    <true/>\n";
    out << "    <key>KeepAlive</key>\n    <false/>\n";
    out << "    <key>StandardOutPath</key>\n    <string>/tmp/hazelnutd.stdout.log</string>\n";
    out << "    <key>StandardErrorPath</key>\n    <string>/tmp/hazelnutd.stderr.log</string>\n";
    out << "</dict>\n</plist>\n";
    return out.str();
}

std::string render_systemd_unit(const fs::path& binary) {
    std::ostringstream out;
    out << "[Unit]\nDescription=Hazelnut File Organizer Daemon\nAfter=default.target\n\n";
    out << "[Service]\nType=simple\nExecStart=" << binary.string() << " " << RUN_SUBCOMMAND
        << "\nRestart=on-failure\nRestartSec=5\n\n";
    out << "[Install]\nWantedBy=default.target\n";
    return out.str();
}

std::string render_desktop_entry(const fs::path& binary) {
    std::ostringstream out;
    out << "[Desktop Entry]\nType=Application\nName=Hazelnut Daemon\n";
    out << "Exec=" << binary.string() << " " << RUN_SUBCOMMAND << "\n";
    out << "Hidden=false\nNoDisplay=true\nX-GNOME-Autostart-enabled=true\n";
    return out.str();
}

std::string render_descriptor(AutostartPlatform platform, const fs::path& binary) {
    switch (platform) {
    case AutostartPlatform::MacServiceAgent:
        return render_launch_agent(binary);
    case AutostartPlatform::LinuxSystemdUser:
        return render_systemd_unit(binary);
    case AutostartPlatform::LinuxDesktopAutostart:
        return render_desktop_entry(binary);
    case AutostartPlatform::Unsupported:
        break;
    }
    return "";
}

} // namespace autostart
