#include "autostart.hpp"
#include "binary_locator.hpp"
#include "logger.hpp"
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace autostart {

namespace {

// A symlinked descriptor (dotfile managers) is written through to its target
// so the link survives the rename.
fs::path write_destination(const fs::path& descriptor) {
    std::error_code ec;
    if (!fs::is_symlink(descriptor, ec))
        return descriptor;
    fs::path resolved = fs::canonical(descriptor, ec);
    if (!ec)
        return resolved;
    fs::path link = fs::read_symlink(descriptor, ec);
    if (ec)
        return descriptor;
    if (link.is_relative())
        link = descriptor.parent_path() / link;
    return link.lexically_normal();
}

} // namespace

AutostartRegistrar::AutostartRegistrar(procutil::CommandRunner runner, PlatformDetector detector,
                                       BinaryResolver resolver)
    : runner_(std::move(runner)), detector_(std::move(detector)), resolver_(std::move(resolver)) {}

AutostartPlatform AutostartRegistrar::platform() const {
    if (detector_)
        return detector_();
    return detect_platform(runner_);
}

std::optional<AutostartTarget> AutostartRegistrar::target() const {
    AutostartTarget t;
    t.platform = platform();
    if (t.platform == AutostartPlatform::Unsupported)
        return std::nullopt;
    auto path = descriptor_path(t.platform);
    if (!path)
        return std::nullopt;
    t.descriptor_path = *path;
    return t;
}

bool AutostartRegistrar::is_enabled() const {
    auto t = target();
    if (!t)
        return false;
    std::error_code ec;
    return fs::exists(t->descriptor_path, ec);
}

bool AutostartRegistrar::fail(AutostartErrc code, const std::string& message) {
    error_.code = code;
    error_.message = message;
    log_error("Autostart operation failed", {{"reason", message}});
    return false;
}

void AutostartRegistrar::reload_service_manager(AutostartPlatform platform) const {
    if (platform != AutostartPlatform::LinuxSystemdUser || !runner_)
        return;
    procutil::CommandResult res = runner_({"systemctl", "--user", "daemon-reload"});
    if (!res.success())
        log_debug("systemctl --user daemon-reload failed",
                  {{"exit_code", std::to_string(res.exit_code)}});
}

bool AutostartRegistrar::enable() {
    error_ = {};
    auto t = target();
    if (!t)
        return fail(AutostartErrc::Unsupported, "Auto-start not supported on this platform");

    std::optional<fs::path> binary =
        resolver_ ? resolver_() : procutil::locate_daemon_binary(runner_);
    if (!binary || binary->empty())
        return fail(AutostartErrc::BinaryNotFound,
                    "Could not find hazelnutd binary. Make sure it's installed and in PATH.");
    t->descriptor_content = render_descriptor(t->platform, *binary);

    fs::path dest = write_destination(t->descriptor_path);
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
        return fail(AutostartErrc::Io, "Failed to create " + dest.parent_path().string() + ": " +
                                           ec.message());

    // Write beside the target and rename so a failed write keeps the old file.
    fs::path tmp = dest;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return fail(AutostartErrc::Io, "Failed to open " + tmp.string() + " for writing");
        out << t->descriptor_content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return fail(AutostartErrc::Io, "Failed to write " + tmp.string());
        }
    }
    fs::rename(tmp, dest, ec);
    if (ec) {
        std::string msg = "Failed to install " + dest.string() + ": " + ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fail(AutostartErrc::Io, msg);
    }

    reload_service_manager(t->platform);
    log_info("Auto-start enabled", {{"platform", platform_name(t->platform)},
                                    {"path", t->descriptor_path.string()},
                                    {"binary", binary->string()}});
    return true;
}

bool AutostartRegistrar::disable() {
    error_ = {};
    auto t = target();
    if (!t)
        return fail(AutostartErrc::Unsupported, "Auto-start not supported on this platform");

    std::error_code ec;
    if (fs::exists(t->descriptor_path, ec)) {
        fs::remove(t->descriptor_path, ec);
        if (ec)
            return fail(AutostartErrc::Io,
                        "Failed to remove " + t->descriptor_path.string() + ": " + ec.message());
    }

    reload_service_manager(t->platform);
    log_info("Auto-start disabled", {{"platform", platform_name(t->platform)},
                                     {"path", t->descriptor_path.string()}});
    return true;
}

std::optional<bool> AutostartRegistrar::toggle() {
    if (is_enabled()) {
        if (!disable())
            return std::nullopt;
        return false;
    }
    if (!enable())
        return std::nullopt;
    return true;
}

} // namespace autostart
