#include "command_runner.hpp"
#include "system_utils.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace procutil {

namespace {

bool make_pipe(UniqueFd& rd, UniqueFd& wr) {
    int fds[2];
    if (pipe(fds) != 0)
        return false;
    rd.reset(fds[0]);
    wr.reset(fds[1]);
    fcntl(rd.get(), F_SETFD, FD_CLOEXEC);
    fcntl(wr.get(), F_SETFD, FD_CLOEXEC);
    return true;
}

} // namespace

CommandResult run_command(const std::vector<std::string>& args) {
    CommandResult result;
    if (args.empty())
        return result;

    UniqueFd out_rd, out_wr;
    UniqueFd err_rd, err_wr; // child reports exec failure through this pipe
    if (!make_pipe(out_rd, out_wr) || !make_pipe(err_rd, err_wr))
        return result;

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        return result;
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        dup2(out_wr.get(), STDOUT_FILENO);
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t w = write(err_wr.get(), &err, sizeof(err));
        (void)w;
        _exit(127);
    }

    out_wr.reset();
    err_wr.reset();

    char buf[4096];
    while (true) {
        ssize_t n = read(out_rd.get(), buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }

    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(err_rd.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0)
        return result;

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.launched = false;
        result.exit_code = 127;
        return result;
    }

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

CommandRunner system_runner() { return run_command; }

} // namespace procutil
