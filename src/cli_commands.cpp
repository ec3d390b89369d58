#include <iostream>
#include <signal.h>

#include "cli_commands.hpp"
#include "daemon.hpp"
#include "logger.hpp"
#include "pid_file.hpp"
#include "process_probe.hpp"

namespace cli {

namespace {

void print_state(std::ostream& out, bool enabled, const autostart::AutostartRegistrar& registrar) {
    out << "Auto-start: " << (enabled ? "enabled" : "disabled");
    if (auto t = registrar.target())
        out << " (" << autostart::platform_name(t->platform) << ", "
            << t->descriptor_path.string() << ")";
    out << "\n";
}

} // namespace

int handle_autostart(const Options& opts, autostart::AutostartRegistrar& registrar,
                     std::ostream& out, std::ostream& err) {
    switch (opts.autostart_action) {
    case AutostartAction::Status:
        print_state(out, registrar.is_enabled(), registrar);
        return 0;
    case AutostartAction::Enable:
        if (!registrar.enable())
            break;
        print_state(out, true, registrar);
        return 0;
    case AutostartAction::Disable:
        if (!registrar.disable())
            break;
        print_state(out, false, registrar);
        return 0;
    case AutostartAction::Toggle:
        if (auto state = registrar.toggle()) {
            print_state(out, *state, registrar);
            return 0;
        }
        break;
    }
    err << registrar.last_error().message << std::endl;
    return 1;
}

int handle_status(const Options& opts, const autostart::AutostartRegistrar& registrar,
                  std::ostream& out) {
    long pid = 0;
    if (procutil::read_pid_file(opts.pid_file, pid) && procutil::process_is_running(pid)) {
        out << "Daemon status: running (PID " << pid << ")\n";
        if (auto up = procutil::read_process_uptime(pid))
            out << "Uptime: " << *up << "\n";
    } else {
        out << "Daemon status: not running\n";
    }
    out << "Auto-start: " << (registrar.is_enabled() ? "enabled" : "disabled") << "\n";
    return 0;
}

int handle_stop(const Options& opts, std::ostream& out, std::ostream& err) {
    long pid = 0;
    if (!procutil::read_pid_file(opts.pid_file, pid) || !procutil::process_is_running(pid)) {
        out << "No running instance" << std::endl;
        return 0;
    }
    if (!procutil::terminate_process(pid)) {
        err << "Failed to terminate process " << pid << std::endl;
        return 1;
    }
    out << "Stopping hazelnut daemon (PID " << pid << ")" << std::endl;
    return 0;
}

int handle_restart(const Options& opts, std::ostream& out, std::ostream& err,
                   const DaemonLauncher& launch, std::chrono::milliseconds stop_timeout) {
    long pid = 0;
    if (procutil::read_pid_file(opts.pid_file, pid) && procutil::process_is_running(pid)) {
        out << "Restarting hazelnut daemon (PID " << pid << ")" << std::endl;
        if (!procutil::terminate_process(pid)) {
            err << "Failed to terminate process " << pid << std::endl;
            return 1;
        }
        if (!procutil::wait_for_exit(pid, stop_timeout)) {
            err << "Process " << pid << " did not exit" << std::endl;
            log_error("Restart aborted, old daemon still running", {{"pid", std::to_string(pid)}});
            return 1;
        }
    } else {
        out << "No running instance, starting" << std::endl;
    }
    return launch(opts);
}

int handle_reload(const Options& opts, std::ostream& out, std::ostream& err) {
    long pid = 0;
    if (!procutil::read_pid_file(opts.pid_file, pid) || !procutil::process_is_running(pid)) {
        err << "No running instance" << std::endl;
        return 1;
    }
    if (!procutil::signal_process(pid, SIGHUP)) {
        err << "Failed to signal process " << pid << std::endl;
        return 1;
    }
    out << "Reloading configuration (PID " << pid << ")" << std::endl;
    return 0;
}

int handle_update(const Options& opts, const update::PackageOrigin& origin,
                  const procutil::CommandRunner& runner, const update::HttpFetcher& fetcher,
                  std::ostream& out, std::ostream& err) {
    using Kind = update::VersionCheck::Kind;
    update::VersionCheck check = update::check_for_updates(opts.update_timeout, fetcher);
    switch (check.kind) {
    case Kind::UpToDate:
        out << "hazelnut is up to date (" << HAZELNUT_VERSION << ")" << std::endl;
        return 0;
    case Kind::CheckFailed:
        err << "Could not check for updates: " << check.reason << std::endl;
        return 1;
    case Kind::UpdateAvailable:
        out << "Update available: " << check.current << " -> " << check.latest << std::endl;
        break;
    }
    if (opts.check_only) {
        out << "Run `" << origin.update_command() << "` to update" << std::endl;
        return 0;
    }
    out << "Updating via " << origin.name() << "..." << std::endl;
    std::string error;
    if (!update::run_update(origin, runner, error)) {
        err << error << std::endl;
        return 1;
    }
    out << "Updated to " << check.latest << std::endl;
    return 0;
}

int handle_run(const Options& opts) {
    bool detach = opts.command == Command::Start || opts.command == Command::Restart;
    if (detach && !opts.foreground) {
        std::cout << "Starting hazelnut daemon..." << std::endl;
        if (!procutil::daemonize()) {
            std::cerr << "Failed to detach from terminal" << std::endl;
            return 1;
        }
    }
    return procutil::run_daemon(opts);
}

} // namespace cli
