/**
 * @file hazelnutd.cpp
 * @brief Entry point of the hazelnut background daemon.
 *
 * Dispatches the host-integration commands: foreground run, start/stop,
 * status, autostart registration and self-update.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

#ifndef HAZELNUT_NO_MAIN
namespace {

void setup_logging(const Options& opts) {
    const LoggingOptions& lo = opts.logging;
    if (!lo.log_file.empty() &&
        !init_logger(lo.log_file.string(), lo.log_level, lo.max_log_size, lo.max_log_files))
        std::cerr << "Continuing without a log file" << std::endl;
    set_json_logging(lo.json_log);
    set_log_compression(lo.compress_logs);
    if (lo.use_syslog)
        init_syslog();
}

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

} // namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parse_options(argc, argv);
        if (opts.command == Command::Help) {
            print_help(argv[0], std::cout);
            return 0;
        }
        if (opts.command == Command::Version) {
            std::cout << "hazelnutd " << HAZELNUT_VERSION << "\n";
            return 0;
        }
        setup_logging(opts);
        LoggerGuard logger_guard;

        procutil::CommandRunner runner = procutil::system_runner();
        autostart::AutostartRegistrar registrar(runner);
        switch (opts.command) {
        case Command::Run:
        case Command::Start:
            return cli::handle_run(opts);
        case Command::Stop:
            return cli::handle_stop(opts, std::cout, std::cerr);
        case Command::Restart:
            return cli::handle_restart(opts, std::cout, std::cerr, cli::handle_run);
        case Command::Reload:
            return cli::handle_reload(opts, std::cout, std::cerr);
        case Command::Status:
            return cli::handle_status(opts, registrar, std::cout);
        case Command::Autostart:
            return cli::handle_autostart(opts, registrar, std::cout, std::cerr);
        case Command::Update:
            return cli::handle_update(opts, update::installation_origin(), runner, {}, std::cout,
                                      std::cerr);
        default:
            break;
        }
        print_help(argv[0], std::cerr);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
#endif // HAZELNUT_NO_MAIN
