#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP
#include <functional>
#include <string>
#include <vector>

namespace procutil {

/** Outcome of one external command invocation. */
struct CommandResult {
    bool launched = false; ///< The program could be executed at all.
    int exit_code = -1;    ///< Exit status, or 128 + signal number.
    bool signaled = false; ///< Terminated by a signal rather than exiting.
    std::string output;    ///< Captured standard output.

    bool success() const { return launched && !signaled && exit_code == 0; }
};

/**
 * Capability for running external programs. The first element of the argument
 * vector names the program, which is looked up in @c PATH. Tests substitute
 * canned responses instead of invoking real system tools.
 */
using CommandRunner = std::function<CommandResult(const std::vector<std::string>&)>;

/**
 * @brief Run @p args synchronously without a shell.
 *
 * Standard output is captured, standard error is discarded and standard input
 * is connected to /dev/null. Arguments are passed verbatim so they are never
 * subject to shell expansion.
 */
CommandResult run_command(const std::vector<std::string>& args);

/** @brief The runner that executes real processes through run_command(). */
CommandRunner system_runner();

} // namespace procutil

#endif // COMMAND_RUNNER_HPP
