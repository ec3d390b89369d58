#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "path_utils.hpp"
#include "pid_file.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> KNOWN_FLAGS{
    "--config",     "--log-file",  "--log-level",  "--json-log", "--syslog",
    "--max-log-size", "--log-files", "--compress-logs", "--pid-file", "--timeout",
    "--check-only", "--foreground", "--help",      "--version"};

const std::set<std::string> VALUE_FLAGS{"--config",    "--log-file",  "--log-level",
                                        "--max-log-size", "--log-files", "--pid-file",
                                        "--timeout"};

const std::map<char, std::string> SHORT_FLAGS{
    {'c', "--config"}, {'f', "--foreground"}, {'h', "--help"}, {'V', "--version"},
    {'t', "--timeout"}};

bool truthy(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "" || v == "1" || v == "true" || v == "yes" || v == "on";
}

unsigned long long parse_count(const std::string& flag, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); }))
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Value out of range for " + flag + ": " + value);
    }
}

// Accepts "5", "5s", "1500ms" or "1m".
std::chrono::milliseconds parse_timeout(const std::string& flag, const std::string& value) {
    std::string num = value;
    long long mult = 1000;
    auto ends_with = [&](const std::string& suf) {
        return num.size() > suf.size() &&
               num.compare(num.size() - suf.size(), suf.size(), suf) == 0;
    };
    if (ends_with("ms")) {
        mult = 1;
        num.erase(num.size() - 2);
    } else if (ends_with("s")) {
        num.pop_back();
    } else if (ends_with("m")) {
        mult = 60 * 1000;
        num.pop_back();
    }
    unsigned long long n = parse_count(flag, num);
    if (n == 0)
        throw std::runtime_error(flag + " must be greater than zero");
    return std::chrono::milliseconds(static_cast<long long>(n) * mult);
}

AutostartAction parse_autostart_action(const std::string& word) {
    if (word == "enable" || word == "on")
        return AutostartAction::Enable;
    if (word == "disable" || word == "off")
        return AutostartAction::Disable;
    if (word == "toggle")
        return AutostartAction::Toggle;
    if (word == "status")
        return AutostartAction::Status;
    throw std::runtime_error("Unknown autostart action: " + word);
}

Command parse_command(const std::string& word) {
    static const std::map<std::string, Command> commands{
        {"run", Command::Run},          {"start", Command::Start},
        {"stop", Command::Stop},        {"restart", Command::Restart},
        {"reload", Command::Reload},    {"status", Command::Status},
        {"autostart", Command::Autostart}, {"update", Command::Update},
        {"version", Command::Version},  {"help", Command::Help}};
    auto it = commands.find(word);
    if (it == commands.end())
        throw std::runtime_error("Unknown command: " + word);
    return it->second;
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, KNOWN_FLAGS, VALUE_FLAGS, SHORT_FLAGS);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;

    std::map<std::string, std::string> cfg;
    if (parser.has_flag("--config")) {
        opts.config_file = expand_path(parser.get_option("--config"));
        std::string err;
        if (!load_config_file(opts.config_file.string(), cfg, err))
            throw std::runtime_error("Failed to load config: " + err);
    } else {
        opts.config_file = default_config_file();
        if (!opts.config_file.empty()) {
            std::string err;
            if (!load_config_file(opts.config_file.string(), cfg, err))
                throw std::runtime_error("Failed to load config " + opts.config_file.string() +
                                         ": " + err);
        }
    }

    auto value_of = [&](const std::string& flag) -> std::string {
        if (parser.has_flag(flag))
            return parser.get_option(flag);
        auto it = cfg.find(flag);
        return it == cfg.end() ? std::string() : it->second;
    };
    auto present = [&](const std::string& flag) {
        return parser.has_flag(flag) || cfg.count(flag) > 0;
    };
    auto cfg_flag = [&](const std::string& flag) {
        if (parser.has_flag(flag))
            return true;
        auto it = cfg.find(flag);
        return it != cfg.end() && truthy(it->second);
    };

    const auto& pos = parser.positional();
    if (parser.has_flag("--help"))
        opts.command = Command::Help;
    else if (parser.has_flag("--version"))
        opts.command = Command::Version;
    else if (pos.empty())
        opts.command = Command::Help;
    else
        opts.command = parse_command(pos.front());

    if (opts.command == Command::Autostart && pos.size() > 1)
        opts.autostart_action = parse_autostart_action(pos[1]);

    if (present("--log-level")) {
        auto level = parse_log_level(value_of("--log-level"));
        if (!level)
            throw std::runtime_error("Invalid log level: " + value_of("--log-level"));
        opts.logging.log_level = *level;
    } else if (const char* env = std::getenv("HAZELNUT_LOG"); env && *env) {
        if (auto level = parse_log_level(env))
            opts.logging.log_level = *level;
    }

    if (present("--log-file"))
        opts.logging.log_file = expand_path(value_of("--log-file"));
    else if (fs::path dir = config_dir(); !dir.empty())
        opts.logging.log_file = dir / "hazelnut" / "hazelnutd.log";
    if (present("--max-log-size"))
        opts.logging.max_log_size = parse_count("--max-log-size", value_of("--max-log-size"));
    if (present("--log-files"))
        opts.logging.max_log_files = parse_count("--log-files", value_of("--log-files"));
    opts.logging.compress_logs = cfg_flag("--compress-logs");
    opts.logging.json_log = cfg_flag("--json-log");
    opts.logging.use_syslog = cfg_flag("--syslog");

    opts.pid_file = present("--pid-file") ? expand_path(value_of("--pid-file"))
                                          : procutil::default_pid_file();

    if (parser.has_flag("--timeout"))
        opts.update_timeout = parse_timeout("--timeout", parser.get_option("--timeout"));
    else if (cfg.count("--update-timeout"))
        opts.update_timeout = parse_timeout("update-timeout", cfg["--update-timeout"]);

    // start detaches and changes to /, so keep file locations independent of cwd.
    if (!opts.pid_file.empty())
        opts.pid_file = fs::absolute(opts.pid_file);
    if (!opts.logging.log_file.empty())
        opts.logging.log_file = fs::absolute(opts.logging.log_file);

    opts.check_only = parser.has_flag("--check-only");
    opts.foreground = cfg_flag("--foreground");
    return opts;
}
