#include "installation.hpp"
#include "logger.hpp"
#include "system_utils.hpp"
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace update {

namespace {

std::string describe_failure(const std::string& tool, const procutil::CommandResult& res) {
    if (!res.launched)
        return "Failed to run " + tool;
    if (res.signaled)
        return "Update failed: " + tool + " terminated by signal " +
               std::to_string(res.exit_code - 128);
    return "Update failed with status: " + std::to_string(res.exit_code);
}

} // namespace

std::string PackageOrigin::name() const {
    return origin == InstallOrigin::SystemPackageManager ? "brew" : "cargo";
}

std::string PackageOrigin::update_command() const {
    if (origin == InstallOrigin::SystemPackageManager)
        return "brew upgrade " + formula;
    return std::string("cargo install ") + PACKAGE_NAME;
}

std::optional<std::string> parse_brew_formula(const std::string& json) {
    nlohmann::json root = nlohmann::json::parse(json, nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return std::nullopt;
    auto formulae = root.find("formulae");
    if (formulae == root.end() || !formulae->is_array() || formulae->empty())
        return std::nullopt;
    const auto& first = formulae->front();
    if (!first.is_object())
        return std::nullopt;
    auto full_name = first.find("full_name");
    if (full_name == first.end() || !full_name->is_string())
        return std::nullopt;
    std::string name = full_name->get<std::string>();
    if (name.empty())
        return std::nullopt;
    return name;
}

PackageOrigin detect_install_origin(const fs::path& exe, const procutil::CommandRunner& runner) {
    PackageOrigin pm;
    const std::string exe_str = exe.string();
    // e.g. /opt/homebrew/Cellar/hazelnut/0.2.16/bin/hazelnutd
    if (exe_str.find("/Cellar/") == std::string::npos &&
        exe_str.find("/homebrew/") == std::string::npos)
        return pm;

    pm.origin = InstallOrigin::SystemPackageManager;
    pm.formula = PACKAGE_NAME;
    if (!runner)
        return pm;
    procutil::CommandResult res = runner({"brew", "info", "--json=v2", PACKAGE_NAME});
    if (!res.success()) {
        log_debug("brew info failed, using default formula name");
        return pm;
    }
    if (auto formula = parse_brew_formula(res.output))
        pm.formula = *formula;
    else
        log_debug("brew info returned unexpected JSON, using default formula name");
    return pm;
}

const PackageOrigin& installation_origin() {
    static const PackageOrigin origin =
        detect_install_origin(procutil::current_executable(), procutil::system_runner());
    return origin;
}

bool run_update(const PackageOrigin& origin, const procutil::CommandRunner& runner,
                std::string& error) {
    if (!runner) {
        error = "No command runner available";
        return false;
    }
    log_info("Running update", {{"manager", origin.name()}, {"command", origin.update_command()}});

    if (origin.origin == InstallOrigin::ToolchainInstaller) {
        procutil::CommandResult res = runner({"cargo", "install", PACKAGE_NAME});
        if (res.success())
            return true;
        error = describe_failure("cargo", res);
        log_error("Update failed", {{"reason", error}});
        return false;
    }

    // Refresh taps so upgrade sees the newest formula; failure is tolerated.
    procutil::CommandResult refresh = runner({"brew", "update"});
    if (!refresh.success())
        log_debug("brew update failed", {{"exit_code", std::to_string(refresh.exit_code)}});

    procutil::CommandResult res = runner({"brew", "upgrade", origin.formula});
    if (res.success())
        return true;
    if (!res.launched || res.signaled) {
        error = describe_failure("brew", res);
        log_error("Update failed", {{"reason", error}});
        return false;
    }

    // upgrade exits non-zero when already current
    log_debug("brew upgrade failed, trying reinstall",
              {{"exit_code", std::to_string(res.exit_code)}});
    res = runner({"brew", "reinstall", origin.formula});
    if (res.success())
        return true;
    error = describe_failure("brew", res);
    log_error("Update failed", {{"reason", error}});
    return false;
}

} // namespace update
