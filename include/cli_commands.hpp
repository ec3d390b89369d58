#pragma once

#include <chrono>
#include <functional>
#include <ostream>

#include "autostart.hpp"
#include "command_runner.hpp"
#include "installation.hpp"
#include "options.hpp"
#include "update_checker.hpp"

namespace cli {

/** Starts the daemon for `restart`; handle_run() outside of tests. */
using DaemonLauncher = std::function<int(const Options&)>;

/** How long `restart` waits for the old process to exit. */
inline constexpr std::chrono::seconds STOP_TIMEOUT{10};

/**
 * @brief Handle `autostart [enable|disable|toggle|status]`.
 *
 * Prints the resulting state, or the failure reason on @p err.
 */
int handle_autostart(const Options& opts, autostart::AutostartRegistrar& registrar,
                     std::ostream& out, std::ostream& err);

/**
 * @brief Handle `status`.
 *
 * Reads the pid file and reports whether that process is alive together with
 * its uptime when available. Also shows whether autostart is enabled.
 */
int handle_status(const Options& opts, const autostart::AutostartRegistrar& registrar,
                  std::ostream& out);

/**
 * @brief Handle `stop` by sending SIGTERM to the recorded daemon.
 */
int handle_stop(const Options& opts, std::ostream& out, std::ostream& err);

/**
 * @brief Handle `restart`.
 *
 * Sends SIGTERM to the recorded daemon, waits up to @p stop_timeout for it to
 * exit and then starts a new instance through @p launch. When nothing is
 * running the daemon is simply started.
 */
int handle_restart(const Options& opts, std::ostream& out, std::ostream& err,
                   const DaemonLauncher& launch,
                   std::chrono::milliseconds stop_timeout = STOP_TIMEOUT);

/**
 * @brief Handle `reload` by sending SIGHUP to the recorded daemon.
 */
int handle_reload(const Options& opts, std::ostream& out, std::ostream& err);

/**
 * @brief Handle `update`.
 *
 * Checks crates.io first. With `--check-only` only the result is printed;
 * otherwise an available update is installed through the package manager
 * that installed the running binary.
 */
int handle_update(const Options& opts, const update::PackageOrigin& origin,
                  const procutil::CommandRunner& runner, const update::HttpFetcher& fetcher,
                  std::ostream& out, std::ostream& err);

/**
 * @brief Handle `run`, `start` and the start half of `restart`.
 *
 * `start` and `restart` detach first unless `--foreground` is given.
 */
int handle_run(const Options& opts);

} // namespace cli
