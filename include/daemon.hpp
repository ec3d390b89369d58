#ifndef DAEMON_HPP
#define DAEMON_HPP
#include "options.hpp"

namespace procutil {

/**
 * @brief Detach from the controlling terminal with the double-fork idiom.
 *
 * Only the grandchild returns, with `true`; the intermediate processes exit.
 * Standard streams are redirected to /dev/null.
 */
bool daemonize();

/**
 * @brief Run the daemon in the foreground until SIGINT or SIGTERM.
 *
 * Holds the pid file for the lifetime of the run so that `status` and `stop`
 * can find the process. SIGHUP, sent by `reload`, is logged and the loop continues.
 *
 * @return Process exit code.
 */
int run_daemon(const Options& opts);

} // namespace procutil

#endif // DAEMON_HPP
