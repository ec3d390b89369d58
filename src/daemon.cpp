#include "daemon.hpp"
#include "logger.hpp"
#include "pid_file.hpp"
#include "version.hpp"
#include <fcntl.h>
#include <iostream>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace procutil {

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0)
        return false;
    if (pid > 0)
        _exit(0);

    if (setsid() < 0)
        return false;

    signal(SIGHUP, SIG_IGN);
    pid = fork();
    if (pid < 0)
        return false;
    if (pid > 0)
        _exit(0);

    umask(022);
    if (chdir("/") != 0)
        return false;

    int fd = open("/dev/null", O_RDWR);
    if (fd < 0)
        return false;
    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO)
        close(fd);
    signal(SIGHUP, SIG_DFL);
    return true;
}

int run_daemon(const Options& opts) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
        log_error("Failed to block termination signals");
        return 1;
    }

    PidFileGuard guard(opts.pid_file);
    if (!guard.locked) {
        log_error("Could not acquire pid file",
                  {{"path", opts.pid_file.string()}, {"reason", guard.error}});
        std::cerr << guard.error << std::endl;
        return 1;
    }
    log_info("Daemon started", {{"pid", std::to_string(getpid())}, {"version", HAZELNUT_VERSION}});

    while (true) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) {
            log_error("sigwait failed");
            return 1;
        }
        if (sig == SIGHUP) {
            log_info("Reload requested");
            continue;
        }
        log_info("Shutting down", {{"signal", std::to_string(sig)}});
        break;
    }
    return 0;
}

} // namespace procutil
