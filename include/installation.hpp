#ifndef INSTALLATION_HPP
#define INSTALLATION_HPP
#include <filesystem>
#include <optional>
#include <string>
#include "command_runner.hpp"

namespace update {

/** Name of the published package on both crates.io and Homebrew. */
inline constexpr const char* PACKAGE_NAME = "hazelnut";

enum class InstallOrigin {
    ToolchainInstaller,   ///< cargo install
    SystemPackageManager, ///< Homebrew
};

/** How the running binary was installed. */
struct PackageOrigin {
    InstallOrigin origin = InstallOrigin::ToolchainInstaller;
    std::string formula; ///< Homebrew formula, possibly tap-qualified.

    /** @return "cargo" or "brew". */
    std::string name() const;

    /** @return The command line a user would run to update manually. */
    std::string update_command() const;

    bool operator==(const PackageOrigin& other) const {
        return origin == other.origin && formula == other.formula;
    }
};

/**
 * @brief Extract `formulae[0].full_name` from `brew info --json=v2` output.
 *
 * @return The formula name, or `std::nullopt` for malformed or unexpected
 *         JSON.
 */
std::optional<std::string> parse_brew_formula(const std::string& json);

/**
 * @brief Infer the installation origin from the executable path.
 *
 * Paths inside a Homebrew prefix (`/Cellar/` or `/homebrew/`) are attributed
 * to Homebrew, whose metadata is queried through @p runner for the exact
 * formula name; `hazelnut` is used when the query fails. Anything else is
 * treated as a cargo install.
 */
PackageOrigin detect_install_origin(const std::filesystem::path& exe,
                                    const procutil::CommandRunner& runner);

/**
 * @brief Origin of the running executable.
 *
 * Computed on first use from procutil::current_executable() and immutable for
 * the rest of the process.
 */
const PackageOrigin& installation_origin();

/**
 * @brief Update the package through the manager that installed it.
 *
 * cargo: `cargo install hazelnut`. Homebrew: `brew update` (result ignored),
 * then `brew upgrade <formula>`; when that exits non-zero without being
 * killed by a signal, `brew reinstall <formula>` is tried once.
 *
 * @param origin Installation origin to drive.
 * @param runner Executes the package manager.
 * @param error  Receives a human-readable reason on failure.
 * @return `true` if the final command succeeded.
 */
bool run_update(const PackageOrigin& origin, const procutil::CommandRunner& runner,
                std::string& error);

} // namespace update

#endif // INSTALLATION_HPP
