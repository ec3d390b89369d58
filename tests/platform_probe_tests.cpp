#include "test_common.hpp"
#include "platform_probe.hpp"

using autostart::AutostartPlatform;

TEST_CASE("systemd availability follows the version probe") {
    StubRunner stub;
    REQUIRE_FALSE(autostart::systemd_user_available(stub.runner()));
    stub.responses["systemctl --user --version"] = StubRunner::ok("systemd 255\n");
    REQUIRE(autostart::systemd_user_available(stub.runner()));
    stub.responses["systemctl --user --version"] = StubRunner::exit_with(1);
    REQUIRE_FALSE(autostart::systemd_user_available(stub.runner()));
    REQUIRE_FALSE(autostart::systemd_user_available(procutil::CommandRunner{}));
}

#ifdef __linux__
TEST_CASE("linux prefers systemd and falls back to XDG autostart") {
    StubRunner stub;
    stub.responses["systemctl --user --version"] = StubRunner::ok();
    REQUIRE(autostart::detect_platform(stub.runner()) == AutostartPlatform::LinuxSystemdUser);
    stub.responses.clear();
    REQUIRE(autostart::detect_platform(stub.runner()) ==
            AutostartPlatform::LinuxDesktopAutostart);
    REQUIRE(stub.count("systemctl --user --version") == 2);
}
#elif defined(__APPLE__)
TEST_CASE("macOS always uses a launch agent") {
    StubRunner stub;
    REQUIRE(autostart::detect_platform(stub.runner()) == AutostartPlatform::MacServiceAgent);
    REQUIRE(stub.calls.empty());
}
#endif

TEST_CASE("platform names") {
    REQUIRE(autostart::platform_name(AutostartPlatform::MacServiceAgent) == "launchd");
    REQUIRE(autostart::platform_name(AutostartPlatform::LinuxSystemdUser) == "systemd");
    REQUIRE(autostart::platform_name(AutostartPlatform::LinuxDesktopAutostart) ==
            "xdg-autostart");
    REQUIRE(autostart::platform_name(AutostartPlatform::Unsupported) == "unsupported");
}
