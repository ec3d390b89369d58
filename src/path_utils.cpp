#include "path_utils.hpp"
#include <cstdlib>
#include <regex>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Group 1 holds the braced form, group 2 the bare form.
const std::regex& env_pattern() {
    static const std::regex re(R"(\$\{([^}]+)\}|\$([A-Za-z_][A-Za-z0-9_]*))");
    return re;
}

std::string expand_tilde(const std::string& path) {
    if (path != "~" && path.rfind("~/", 0) != 0)
        return path;
    fs::path home = home_dir();
    if (home.empty())
        return path;
    if (path == "~")
        return home.string();
    return (home / path.substr(2)).string();
}

} // namespace

fs::path home_dir() {
    const char* env = std::getenv("HOME");
    if (env && *env)
        return env;
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir && *pw->pw_dir)
        return pw->pw_dir;
    return {};
}

fs::path config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return xdg;
    fs::path home = home_dir();
    if (home.empty())
        return {};
    return home / ".config";
}

fs::path expand_path(const std::string& path) {
    std::string in = expand_tilde(path);
    const std::regex& re = env_pattern();
    std::string out;
    out.reserve(in.size());
    auto last = in.cbegin();
    for (std::sregex_iterator it(in.begin(), in.end(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(last, m[0].first);
        std::string name = m[1].matched ? m[1].str() : m[2].str();
        const char* val = std::getenv(name.c_str());
        if (val)
            out += val;
        else
            out += m[0].str();
        last = m[0].second;
    }
    out.append(last, in.cend());
    return fs::path(out);
}
