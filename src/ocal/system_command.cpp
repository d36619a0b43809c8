#include "system_command.h"
#include "../common/structured_logger.h"
#include "../common/raii_wrappers.h"
#include <chrono>
#include <thread>
#include <cstring>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#undef ERROR
#else
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#endif

namespace marionette {
namespace ocal {
namespace system {

namespace {
    std::string describeCommand(const std::string& executable,
                                const std::vector<std::string>& arguments) {
        std::string text = executable;
        for (const auto& arg : arguments) {
            text += " " + arg;
        }
        return text;
    }

#ifdef _WIN32
    std::wstring toWide(const std::string& utf8) {
        if (utf8.empty()) return L"";
        int size = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, nullptr, 0);
        std::wstring wide(static_cast<size_t>(size > 0 ? size - 1 : 0), L'\0');
        if (size > 1) {
            MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), -1, &wide[0], size);
        }
        return wide;
    }

    void drainPipe(HANDLE pipe, std::string* sink) {
        char buffer[4096];
        DWORD bytesRead = 0;
        while (ReadFile(pipe, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0) {
            sink->append(buffer, bytesRead);
        }
    }
#else
    using FileDescriptor = raii::HandleWrapper<int, -1>;

    FileDescriptor wrapFd(int fd) {
        return FileDescriptor(fd, [](int handle) { ::close(handle); });
    }

    bool makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd, bool closeOnExec) {
        int fds[2];
        if (::pipe(fds) != 0) {
            return false;
        }
        if (closeOnExec) {
            ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        }
        readEnd = wrapFd(fds[0]);
        writeEnd = wrapFd(fds[1]);
        return true;
    }
#endif
}

std::string quoteWindowsArgument(const std::string& argument) {
    if (!argument.empty() && argument.find_first_of(" \t\n\v\"") == std::string::npos) {
        return argument;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : argument) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted.push_back('"');
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted.push_back(c);
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

CommandResult runProcess(const std::string& executable,
                         const std::vector<std::string>& arguments,
                         int timeoutMs,
                         const std::string& workingDir) {
    CommandResult result;
    result.command = describeCommand(executable, arguments);
    auto startTime = std::chrono::steady_clock::now();

    if (executable.empty()) {
        result.error = "No executable given";
        return result;
    }
    if (timeoutMs <= 0) {
        timeoutMs = 30000;
    }

    SLOG_DEBUG().message("Running external command").context("command", result.command);

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    raii::KernelHandle stdOutRead, stdOutWrite, stdErrRead, stdErrWrite;
    if (!CreatePipe(stdOutRead.out(), stdOutWrite.out(), &sa, 0) ||
        !CreatePipe(stdErrRead.out(), stdErrWrite.out(), &sa, 0)) {
        result.error = "Failed to create pipes for output capture";
        return result;
    }
    SetHandleInformation(stdOutRead.get(), HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdErrRead.get(), HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    ZeroMemory(&pi, sizeof(pi));
    si.cb = sizeof(si);
    si.hStdOutput = stdOutWrite.get();
    si.hStdError = stdErrWrite.get();
    si.hStdInput = nullptr;
    si.dwFlags |= STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;

    std::string cmdLine = quoteWindowsArgument(executable);
    for (const auto& arg : arguments) {
        cmdLine += " " + quoteWindowsArgument(arg);
    }
    std::wstring wCmdLine = toWide(cmdLine);
    std::wstring wWorkDir = toWide(workingDir);

    BOOL created = CreateProcessW(nullptr, &wCmdLine[0], nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr,
                                  workingDir.empty() ? nullptr : wWorkDir.c_str(),
                                  &si, &pi);
    stdOutWrite.reset();
    stdErrWrite.reset();

    if (!created) {
        result.error = "Failed to start process. Error code: " + std::to_string(GetLastError());
        return result;
    }
    result.started = true;
    raii::KernelHandle process(pi.hProcess);
    raii::KernelHandle thread(pi.hThread);

    std::string output;
    std::string errorText;
    std::thread outReader(drainPipe, stdOutRead.get(), &output);
    std::thread errReader(drainPipe, stdErrRead.get(), &errorText);

    DWORD waitResult = WaitForSingleObject(process.get(), static_cast<DWORD>(timeoutMs));
    if (waitResult == WAIT_TIMEOUT) {
        TerminateProcess(process.get(), 1);
        WaitForSingleObject(process.get(), 5000);
        result.timedOut = true;
    }

    outReader.join();
    errReader.join();

    DWORD exitCode = 1;
    if (GetExitCodeProcess(process.get(), &exitCode)) {
        result.exitCode = static_cast<int>(exitCode);
    }
    result.output = std::move(output);
    result.error = std::move(errorText);
#else
    FileDescriptor outRead, outWrite, errRead, errWrite, execRead, execWrite;
    if (!makePipe(outRead, outWrite, false) || !makePipe(errRead, errWrite, false) ||
        !makePipe(execRead, execWrite, true)) {
        result.error = "Failed to create pipes for output capture";
        return result;
    }

    std::vector<std::string> argvStorage;
    argvStorage.push_back(executable);
    argvStorage.insert(argvStorage.end(), arguments.begin(), arguments.end());
    std::vector<char*> argv;
    for (auto& arg : argvStorage) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        if (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    // exec succeeded iff the close-on-exec pipe reaches EOF with no errno written
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        result.error = "Cannot execute '" + executable + "': " + std::strerror(childErrno);
        result.executionTimeMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count());
        return result;
    }
    result.started = true;

    auto deadline = startTime + std::chrono::milliseconds(timeoutMs);
    bool outOpen = true;
    bool errOpen = true;
    char buffer[4096];

    while (outOpen || errOpen) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) { fds[count].fd = outRead.get(); fds[count].events = POLLIN; fds[count].revents = 0; ++count; }
        if (errOpen) { fds[count].fd = errRead.get(); fds[count].events = POLLIN; fds[count].revents = 0; ++count; }

        int ready = ::poll(fds, count, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t bytes = ::read(fds[i].fd, buffer, sizeof(buffer));
            bool isOut = fds[i].fd == outRead.get();
            if (bytes > 0) {
                (isOut ? result.output : result.error).append(buffer, static_cast<size_t>(bytes));
            } else if (bytes == 0 || (errno != EINTR && errno != EAGAIN)) {
                (isOut ? outOpen : errOpen) = false;
            }
        }
    }

    if (result.timedOut) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
    }
#endif

    result.success = result.started && !result.timedOut && result.exitCode == 0;
    if (result.timedOut) {
        result.error = "Command timed out after " + std::to_string(timeoutMs) + "ms" +
                       (result.error.empty() ? "" : ": " + result.error);
    }

    result.executionTimeMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count());

    SLOG_DEBUG().message("External command completed")
        .context("success", result.success)
        .context("exit_code", result.exitCode)
        .context("execution_time_ms", result.executionTimeMs);

    return result;
}

} // namespace system
} // namespace ocal
} // namespace marionette
