#include "binary_locator.hpp"
#include "logger.hpp"
#include "path_utils.hpp"
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace procutil {

namespace {

const char* const COMMON_LOCATIONS[] = {
    "/usr/local/bin/hazelnutd",
    "/opt/homebrew/bin/hazelnutd",
    "/usr/bin/hazelnutd",
};

std::string first_line(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos)
            continue;
        auto e = line.find_last_not_of(" \t\r");
        return line.substr(b, e - b + 1);
    }
    return "";
}

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

} // namespace

std::optional<fs::path> locate_daemon_binary(const CommandRunner& runner) {
    if (runner) {
        CommandResult res = runner({"which", DAEMON_BINARY_NAME});
        if (res.success()) {
            std::string found = first_line(res.output);
            if (!found.empty()) {
                std::error_code ec;
                fs::path abs = fs::absolute(found, ec);
                log_debug("Daemon binary resolved via PATH", {{"path", found}});
                return ec ? fs::path(found) : abs;
            }
        }
    }

    for (const char* candidate : COMMON_LOCATIONS) {
        if (is_file(candidate)) {
            log_debug("Daemon binary found in system location", {{"path", candidate}});
            return fs::path(candidate);
        }
    }

    fs::path home = home_dir();
    if (!home.empty()) {
        fs::path cargo_bin = home / ".cargo" / "bin" / DAEMON_BINARY_NAME;
        if (is_file(cargo_bin)) {
            log_debug("Daemon binary found in cargo bin", {{"path", cargo_bin.string()}});
            return cargo_bin;
        }
    }

    return std::nullopt;
}

} // namespace procutil
