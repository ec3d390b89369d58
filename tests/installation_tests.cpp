#include "test_common.hpp"
#include "installation.hpp"

using update::InstallOrigin;
using update::PackageOrigin;

namespace {

PackageOrigin brew(const std::string& formula) {
    PackageOrigin pm;
    pm.origin = InstallOrigin::SystemPackageManager;
    pm.formula = formula;
    return pm;
}

} // namespace

TEST_CASE("cargo installs are detected from the path") {
    StubRunner stub;
    PackageOrigin pm =
        update::detect_install_origin("/home/u/.cargo/bin/hazelnutd", stub.runner());
    REQUIRE(pm.origin == InstallOrigin::ToolchainInstaller);
    REQUIRE(pm.name() == "cargo");
    REQUIRE(pm.update_command() == "cargo install hazelnut");
    REQUIRE(stub.calls.empty());
}

TEST_CASE("Homebrew installs query the formula name") {
    StubRunner stub;
    stub.responses["brew info --json=v2 hazelnut"] = StubRunner::ok(
        R"({"formulae":[{"name":"hazelnut","full_name":"ricardodantas/tap/hazelnut"}],"casks":[]})");
    PackageOrigin pm = update::detect_install_origin(
        "/opt/homebrew/Cellar/hazelnut/0.2.16/bin/hazelnutd", stub.runner());
    REQUIRE(pm == brew("ricardodantas/tap/hazelnut"));
    REQUIRE(pm.name() == "brew");
    REQUIRE(pm.update_command() == "brew upgrade ricardodantas/tap/hazelnut");
}

TEST_CASE("Homebrew detection falls back to the package name") {
    StubRunner stub;
    PackageOrigin pm =
        update::detect_install_origin("/usr/local/homebrew/bin/hazelnutd", stub.runner());
    REQUIRE(pm == brew("hazelnut"));
    REQUIRE(stub.count("brew info --json=v2 hazelnut") == 1);

    stub.responses["brew info --json=v2 hazelnut"] = StubRunner::ok("{\"formulae\":[]}");
    REQUIRE(update::detect_install_origin("/usr/local/Cellar/hazelnut/1/bin/hazelnutd",
                                          stub.runner()) == brew("hazelnut"));
}

TEST_CASE("brew info JSON parsing") {
    REQUIRE(update::parse_brew_formula(R"({"formulae":[{"full_name":"hazelnut"}]})") ==
            std::optional<std::string>("hazelnut"));
    REQUIRE_FALSE(update::parse_brew_formula("").has_value());
    REQUIRE_FALSE(update::parse_brew_formula("[]").has_value());
    REQUIRE_FALSE(update::parse_brew_formula(R"({"formulae":{}})").has_value());
    REQUIRE_FALSE(update::parse_brew_formula(R"({"formulae":[{"full_name":""}]})").has_value());
    REQUIRE_FALSE(update::parse_brew_formula(R"({"formulae":[{"name":"x"}]})").has_value());
}

TEST_CASE("installation origin is computed once") {
    const PackageOrigin& a = update::installation_origin();
    const PackageOrigin& b = update::installation_origin();
    REQUIRE(&a == &b);
}

TEST_CASE("cargo update runs cargo install") {
    StubRunner stub;
    stub.responses["cargo install hazelnut"] = StubRunner::ok();
    std::string err;
    REQUIRE(update::run_update(PackageOrigin{}, stub.runner(), err));
    REQUIRE(stub.calls == std::vector<std::string>{"cargo install hazelnut"});
}

TEST_CASE("cargo update failures are described") {
    StubRunner stub;
    std::string err;
    REQUIRE_FALSE(update::run_update(PackageOrigin{}, stub.runner(), err));
    REQUIRE(err == "Failed to run cargo");

    stub.responses["cargo install hazelnut"] = StubRunner::exit_with(101);
    REQUIRE_FALSE(update::run_update(PackageOrigin{}, stub.runner(), err));
    REQUIRE(err == "Update failed with status: 101");
}

TEST_CASE("brew update tolerates a failed refresh") {
    StubRunner stub;
    stub.responses["brew update"] = StubRunner::exit_with(1);
    stub.responses["brew upgrade hazelnut"] = StubRunner::ok();
    std::string err;
    REQUIRE(update::run_update(brew("hazelnut"), stub.runner(), err));
    REQUIRE(stub.calls == std::vector<std::string>{"brew update", "brew upgrade hazelnut"});
}

TEST_CASE("brew falls back to reinstall once") {
    StubRunner stub;
    stub.responses["brew update"] = StubRunner::ok();
    stub.responses["brew upgrade hazelnut"] = StubRunner::exit_with(1);
    stub.responses["brew reinstall hazelnut"] = StubRunner::ok();
    std::string err;
    REQUIRE(update::run_update(brew("hazelnut"), stub.runner(), err));
    REQUIRE(stub.count("brew reinstall hazelnut") == 1);

    stub.calls.clear();
    stub.responses["brew reinstall hazelnut"] = StubRunner::exit_with(2);
    REQUIRE_FALSE(update::run_update(brew("hazelnut"), stub.runner(), err));
    REQUIRE(err == "Update failed with status: 2");
    REQUIRE(stub.count("brew reinstall hazelnut") == 1);
}

TEST_CASE("brew upgrade killed by a signal is not retried") {
    StubRunner stub;
    stub.responses["brew update"] = StubRunner::ok();
    stub.responses["brew upgrade hazelnut"] = StubRunner::killed(9);
    std::string err;
    REQUIRE_FALSE(update::run_update(brew("hazelnut"), stub.runner(), err));
    REQUIRE(err.find("signal 9") != std::string::npos);
    REQUIRE(stub.count("brew reinstall hazelnut") == 0);
}

TEST_CASE("update without a runner fails") {
    std::string err;
    REQUIRE_FALSE(update::run_update(PackageOrigin{}, procutil::CommandRunner{}, err));
    REQUIRE_FALSE(err.empty());
}
