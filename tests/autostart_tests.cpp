#include "test_common.hpp"
#include "autostart.hpp"

using autostart::AutostartErrc;
using autostart::AutostartPlatform;
using autostart::AutostartRegistrar;

namespace {

const fs::path FAKE_BINARY = "/usr/local/bin/hazelnutd";

struct Sandbox {
    TempDir tmp{"hazelnut_autostart"};
    ScopedEnv home{"HOME", tmp.path().string()};
    ScopedEnv xdg{"XDG_CONFIG_HOME", (tmp.path() / "xdg").string()};
    StubRunner stub;

    AutostartRegistrar registrar(AutostartPlatform platform,
                                 std::optional<fs::path> binary = FAKE_BINARY) {
        return AutostartRegistrar(
            stub.runner(), [platform] { return platform; }, [binary] { return binary; });
    }
};

} // namespace

TEST_CASE("systemd enable, toggle and disable") {
    Sandbox sb;
    fs::path unit = sb.tmp.path() / ".config" / "systemd" / "user" / "hazelnutd.service";
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxSystemdUser);

    REQUIRE_FALSE(reg.is_enabled());
    REQUIRE(reg.enable());
    REQUIRE(reg.is_enabled());
    REQUIRE(fs::exists(unit));
    REQUIRE(read_file(unit).find("ExecStart=/usr/local/bin/hazelnutd run\n") !=
            std::string::npos);
    REQUIRE(sb.stub.count("systemctl --user daemon-reload") == 1);

    REQUIRE(reg.toggle() == std::optional<bool>(false));
    REQUIRE_FALSE(fs::exists(unit));
    REQUIRE(reg.toggle() == std::optional<bool>(true));
    REQUIRE(fs::exists(unit));

    REQUIRE(reg.disable());
    REQUIRE_FALSE(reg.is_enabled());
    REQUIRE(sb.stub.count("systemctl --user daemon-reload") == 4);
}

TEST_CASE("enable twice writes identical content") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    REQUIRE(reg.enable());
    auto target = reg.target();
    REQUIRE(target.has_value());
    std::string first = read_file(target->descriptor_path);
    REQUIRE(reg.enable());
    REQUIRE(read_file(target->descriptor_path) == first);
    REQUIRE_FALSE(fs::exists(target->descriptor_path.string() + ".tmp"));
}

TEST_CASE("enable replaces a hand edited descriptor") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    fs::path entry = sb.tmp.path() / "xdg" / "autostart" / "hazelnutd.desktop";
    write_file(entry, "garbage");
    REQUIRE(reg.is_enabled());
    REQUIRE(reg.enable());
    REQUIRE(read_file(entry) == autostart::render_desktop_entry(FAKE_BINARY));
}

TEST_CASE("enable writes through a symlinked descriptor") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxSystemdUser);
    fs::path unit = sb.tmp.path() / ".config" / "systemd" / "user" / "hazelnutd.service";
    fs::path managed = sb.tmp.path() / "dotfiles" / "hazelnutd.service";
    write_file(managed, "old unit\n");
    fs::create_directories(unit.parent_path());
    fs::create_symlink(managed, unit);

    REQUIRE(reg.enable());
    REQUIRE(fs::is_symlink(unit));
    REQUIRE(fs::read_symlink(unit) == managed);
    REQUIRE(read_file(managed) == autostart::render_systemd_unit(FAKE_BINARY));
    REQUIRE_FALSE(fs::exists(managed.string() + ".tmp"));
}

TEST_CASE("enable creates the target of a dangling relative symlink") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    fs::path entry = sb.tmp.path() / "xdg" / "autostart" / "hazelnutd.desktop";
    fs::create_directories(entry.parent_path());
    fs::create_symlink(fs::path("..") / "managed" / "hazelnutd.desktop", entry);
    REQUIRE_FALSE(reg.is_enabled());

    REQUIRE(reg.enable());
    REQUIRE(fs::is_symlink(entry));
    REQUIRE(reg.is_enabled());
    REQUIRE(read_file(sb.tmp.path() / "xdg" / "managed" / "hazelnutd.desktop") ==
            autostart::render_desktop_entry(FAKE_BINARY));
}

TEST_CASE("desktop autostart lives under the XDG config directory") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    REQUIRE(reg.enable());
    fs::path entry = sb.tmp.path() / "xdg" / "autostart" / "hazelnutd.desktop";
    REQUIRE(fs::exists(entry));
    REQUIRE(sb.stub.count("systemctl --user daemon-reload") == 0);
}

TEST_CASE("launch agent is written under Library") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::MacServiceAgent);
    REQUIRE(reg.enable());
    fs::path plist =
        sb.tmp.path() / "Library" / "LaunchAgents" / "me.ricardodantas.hazelnutd.plist";
    REQUIRE(read_file(plist) == autostart::render_launch_agent(FAKE_BINARY));
    REQUIRE(reg.disable());
    REQUIRE_FALSE(fs::exists(plist));
}

TEST_CASE("disable without descriptor succeeds") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    REQUIRE(reg.disable());
    REQUIRE_FALSE(reg.is_enabled());
    REQUIRE(reg.last_error().code == AutostartErrc::None);
}

TEST_CASE("unsupported platform") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::Unsupported);
    REQUIRE_FALSE(reg.is_enabled());
    REQUIRE_FALSE(reg.target().has_value());
    REQUIRE_FALSE(reg.enable());
    REQUIRE(reg.last_error().code == AutostartErrc::Unsupported);
    REQUIRE_FALSE(reg.disable());
    REQUIRE(reg.last_error().code == AutostartErrc::Unsupported);
    REQUIRE_FALSE(reg.toggle().has_value());
}

TEST_CASE("missing binary leaves no descriptor behind") {
    Sandbox sb;
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxSystemdUser, std::nullopt);
    REQUIRE_FALSE(reg.enable());
    REQUIRE(reg.last_error().code == AutostartErrc::BinaryNotFound);
    REQUIRE(reg.last_error().message.find("Could not find hazelnutd binary") !=
            std::string::npos);
    REQUIRE_FALSE(reg.is_enabled());
    REQUIRE_FALSE(fs::exists(sb.tmp.path() / ".config" / "systemd" / "user"));
    REQUIRE_FALSE(reg.toggle().has_value());
    REQUIRE_FALSE(reg.is_enabled());
}

TEST_CASE("reload failure does not fail enable") {
    Sandbox sb;
    sb.stub.responses["systemctl --user daemon-reload"] = StubRunner::exit_with(1);
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxSystemdUser);
    REQUIRE(reg.enable());
    REQUIRE(reg.is_enabled());
    REQUIRE(reg.disable());
}

TEST_CASE("unwritable target directory reports an IO error") {
    if (geteuid() == 0) {
        WARN("permission checks do not apply to root");
        return;
    }
    Sandbox sb;
    fs::path xdg = sb.tmp.path() / "xdg";
    fs::create_directories(xdg);
    fs::permissions(xdg, fs::perms::owner_read | fs::perms::owner_exec);
    AutostartRegistrar reg = sb.registrar(AutostartPlatform::LinuxDesktopAutostart);
    REQUIRE_FALSE(reg.enable());
    REQUIRE(reg.last_error().code == AutostartErrc::Io);
    fs::permissions(xdg, fs::perms::owner_all);
}

TEST_CASE("binary is resolved through the runner by default") {
    Sandbox sb;
    sb.stub.responses["which hazelnutd"] = StubRunner::ok("/srv/bin/hazelnutd\n");
    AutostartRegistrar reg(sb.stub.runner(),
                           [] { return AutostartPlatform::LinuxDesktopAutostart; });
    REQUIRE(reg.enable());
    auto t = reg.target();
    REQUIRE(t.has_value());
    REQUIRE(read_file(t->descriptor_path).find("Exec=/srv/bin/hazelnutd run\n") !=
            std::string::npos);
}
