#include "test_common.hpp"
#include "system_utils.hpp"
#include <cerrno>
#include <fcntl.h>

TEST_CASE("UniqueFd closes on scope exit and on reset") {
    int raw = -1;
    {
        procutil::UniqueFd fd(::open("/dev/null", O_RDONLY));
        REQUIRE(fd);
        raw = fd.get();
        REQUIRE(fcntl(raw, F_GETFD) != -1);
    }
    errno = 0;
    REQUIRE(fcntl(raw, F_GETFD) == -1);
    REQUIRE(errno == EBADF);

    procutil::UniqueFd fd(::open("/dev/null", O_RDONLY));
    raw = fd.get();
    fd.reset();
    REQUIRE_FALSE(fd);
    REQUIRE(fcntl(raw, F_GETFD) == -1);
}

TEST_CASE("clock ticks and uid") {
    REQUIRE(procutil::clock_ticks_per_sec() > 0);
    REQUIRE(procutil::current_uid() == static_cast<std::uint32_t>(getuid()));
}

#if defined(__linux__) || defined(__APPLE__)
TEST_CASE("current executable is an absolute path to this test binary") {
    fs::path exe = procutil::current_executable();
    REQUIRE(exe.is_absolute());
    REQUIRE(fs::exists(exe));
    REQUIRE(exe.filename().string().find("hazelnut_tests") != std::string::npos);
}
#endif
