#ifndef MARIONETTE_PROCESS_OPERATIONS_H
#define MARIONETTE_PROCESS_OPERATIONS_H

#include <string>
#include <vector>
#include "desktop_backend.h"

namespace marionette {
namespace ocal {
namespace process {

/**
 * Start a GUI application detached from our stdio
 *
 * @param executablePath Resolved path of the executable
 * @param arguments Arguments passed verbatim
 * @param workingDirectory Working directory, empty for the current one
 * @return Process ID of the new process
 * @throws LaunchError if the executable cannot be started
 */
ProcessId spawn(const std::string& executablePath,
                const std::vector<std::string>& arguments,
                const std::string& workingDirectory);

/**
 * Whether the process exists and has not exited. Reaps our own exited
 * children so they do not linger as zombies.
 */
bool isRunning(ProcessId pid);

/**
 * Whether the process is stopped by a signal (POSIX) or unknown; always
 * false on Windows, where hangs are detected per window
 */
bool isStopped(ProcessId pid);

/**
 * Ask the process to exit (SIGTERM) or kill it outright (SIGKILL / TerminateProcess)
 * @return false if the OS rejected the request or the process does not exist
 */
bool terminate(ProcessId pid, bool force);

std::vector<ProcessInfo> listProcesses();

} // namespace process
} // namespace ocal
} // namespace marionette

#endif // MARIONETTE_PROCESS_OPERATIONS_H
