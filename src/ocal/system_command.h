#ifndef MARIONETTE_SYSTEM_COMMAND_H
#define MARIONETTE_SYSTEM_COMMAND_H

#include <string>
#include <vector>

namespace marionette {
namespace ocal {
namespace system {

struct CommandResult {
    bool started;        // the executable could be run at all
    bool success;        // started, finished in time, exit code 0
    bool timedOut;
    int exitCode;
    std::string output;  // stdout
    std::string error;   // stderr, or a description of why it could not start
    std::string command;
    int executionTimeMs;

    CommandResult() : started(false), success(false), timedOut(false), exitCode(-1),
                      executionTimeMs(0) {}
};

/**
 * Run an executable with an argument vector (no shell) and capture its output
 *
 * @param executable Path or bare name resolved through PATH
 * @param arguments Arguments passed verbatim
 * @param timeoutMs The child is killed once this elapses
 * @param workingDir Working directory for the child (optional)
 * @return CommandResult; never throws for failures of the child itself
 */
CommandResult runProcess(const std::string& executable,
                         const std::vector<std::string>& arguments,
                         int timeoutMs = 30000,
                         const std::string& workingDir = "");

/**
 * Quote one argument for a Windows command line (CommandLineToArgvW rules)
 */
std::string quoteWindowsArgument(const std::string& argument);

} // namespace system
} // namespace ocal
} // namespace marionette

#endif // MARIONETTE_SYSTEM_COMMAND_H
