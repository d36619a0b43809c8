#include "process_operations.h"
#include "system_command.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/raii_wrappers.h"
#include <cstring>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>
#undef ERROR
#else
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <dirent.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <climits>
#endif

namespace marionette {
namespace ocal {
namespace process {

namespace {
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

    std::string toUtf8(const wchar_t* wide) {
        int size = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
        if (size <= 1) return "";
        std::string utf8(static_cast<size_t>(size - 1), '\0');
        WideCharToMultiByte(CP_UTF8, 0, wide, -1, &utf8[0], size, nullptr, nullptr);
        return utf8;
    }

    std::chrono::system_clock::time_point fileTimeToTimePoint(const FILETIME& ft) {
        ULARGE_INTEGER value;
        value.LowPart = ft.dwLowDateTime;
        value.HighPart = ft.dwHighDateTime;
        // 100ns ticks since 1601-01-01
        const unsigned long long EPOCH_DIFFERENCE = 116444736000000000ULL;
        if (value.QuadPart < EPOCH_DIFFERENCE) {
            return std::chrono::system_clock::time_point{};
        }
        auto since1970 = std::chrono::microseconds((value.QuadPart - EPOCH_DIFFERENCE) / 10);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since1970));
    }
#else
    // Boot time from /proc/stat, used to turn /proc/<pid>/stat start ticks into wall time
    std::chrono::system_clock::time_point bootTime() {
        std::ifstream stat("/proc/stat");
        std::string key;
        long long value = 0;
        while (stat >> key) {
            if (key == "btime") {
                stat >> value;
                return std::chrono::system_clock::time_point(std::chrono::seconds(value));
            }
            std::string rest;
            std::getline(stat, rest);
        }
        return std::chrono::system_clock::time_point{};
    }

    struct ProcStat {
        std::string comm;
        char state = '?';
        unsigned long long startTicks = 0;
    };

    bool readProcStat(ProcessId pid, ProcStat& out) {
        std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!file.is_open() || !std::getline(file, line)) {
            return false;
        }

        // comm is parenthesised and may itself contain spaces or ')'
        size_t open = line.find('(');
        size_t close = line.rfind(')');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            return false;
        }
        out.comm = line.substr(open + 1, close - open - 1);

        std::istringstream rest(line.substr(close + 1));
        rest >> out.state;
        // Fields 4..21 precede starttime (field 22)
        std::string skip;
        for (int field = 4; field <= 21; ++field) {
            rest >> skip;
        }
        rest >> out.startTicks;
        return true;
    }

    std::string readExeLink(ProcessId pid) {
        char buffer[PATH_MAX];
        std::string link = "/proc/" + std::to_string(pid) + "/exe";
        ssize_t len = ::readlink(link.c_str(), buffer, sizeof(buffer) - 1);
        if (len <= 0) {
            return "";
        }
        buffer[len] = '\0';
        std::string path(buffer);
        const std::string deleted = " (deleted)";
        if (path.size() > deleted.size() &&
            path.compare(path.size() - deleted.size(), deleted.size(), deleted) == 0) {
            path.resize(path.size() - deleted.size());
        }
        return path;
    }
#endif
}

ProcessId spawn(const std::string& executablePath,
                const std::vector<std::string>& arguments,
                const std::string& workingDirectory) {
#ifdef _WIN32
    std::string cmdLine = system::quoteWindowsArgument(executablePath);
    for (const auto& arg : arguments) {
        cmdLine += " " + system::quoteWindowsArgument(arg);
    }
    std::wstring wCmdLine = toWide(cmdLine);
    std::wstring wPath = toWide(executablePath);
    std::wstring wWorkDir = toWide(workingDirectory);

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessW(wPath.c_str(), &wCmdLine[0], nullptr, nullptr, FALSE, 0, nullptr,
                        workingDirectory.empty() ? nullptr : wWorkDir.c_str(), &si, &pi)) {
        DWORD error = GetLastError();
        throw LaunchError("Failed to start process", "CreateProcess error " + std::to_string(error),
                          executablePath);
    }

    raii::KernelHandle process(pi.hProcess);
    raii::KernelHandle thread(pi.hThread);
    // Let the application finish initialising its message loop before we look for windows
    WaitForInputIdle(process.get(), 2000);

    SLOG_DEBUG().message("Process spawned")
        .context("path", executablePath)
        .context("pid", static_cast<unsigned long>(pi.dwProcessId));
    return static_cast<ProcessId>(pi.dwProcessId);
#else
    int execPipe[2];
    if (::pipe(execPipe) != 0) {
        throw LaunchError("Failed to create launch pipe", std::strerror(errno), executablePath);
    }
    ::fcntl(execPipe[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);
    raii::HandleWrapper<int, -1> execRead(execPipe[0], [](int fd) { ::close(fd); });
    raii::HandleWrapper<int, -1> execWrite(execPipe[1], [](int fd) { ::close(fd); });

    std::vector<std::string> argvStorage;
    argvStorage.push_back(executablePath);
    argvStorage.insert(argvStorage.end(), arguments.begin(), arguments.end());
    std::vector<char*> argv;
    for (auto& arg : argvStorage) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw LaunchError("fork failed", std::strerror(errno), executablePath);
    }

    if (pid == 0) {
        // Own process group so a forced kill also takes helper children down
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execv(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    execWrite.reset();

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw LaunchError("Failed to start process", std::strerror(childErrno), executablePath);
    }

    SLOG_DEBUG().message("Process spawned")
        .context("path", executablePath)
        .context("pid", static_cast<int>(pid));
    return static_cast<ProcessId>(pid);
#endif
}

bool isRunning(ProcessId pid) {
    if (pid == 0) {
        return false;
    }
#ifdef _WIN32
    raii::KernelHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
    if (!process) {
        return false;
    }
    DWORD exitCode = 0;
    return GetExitCodeProcess(process.get(), &exitCode) && exitCode == STILL_ACTIVE;
#else
    int status = 0;
    pid_t reaped = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (reaped == static_cast<pid_t>(pid)) {
        return false;
    }

    if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) {
        return false;
    }

    // Not our child but a zombie nonetheless
    ProcStat stat;
    if (readProcStat(pid, stat)) {
        return stat.state != 'Z' && stat.state != 'X';
    }
    return true;
#endif
}

bool isStopped(ProcessId pid) {
#ifdef _WIN32
    (void)pid;
    return false;
#else
    ProcStat stat;
    return readProcStat(pid, stat) && (stat.state == 'T' || stat.state == 't');
#endif
}

bool terminate(ProcessId pid, bool force) {
    if (pid == 0) {
        SLOG_ERROR().message("Invalid process ID for termination");
        return false;
    }

    SLOG_DEBUG().message("Terminating process")
        .context("pid", pid)
        .context("force", force);

#ifdef _WIN32
    (void)force;
    raii::KernelHandle process(OpenProcess(PROCESS_TERMINATE, FALSE, pid));
    if (!process) {
        return false;
    }
    return TerminateProcess(process.get(), 1) != FALSE;
#else
    int sig = force ? SIGKILL : SIGTERM;
    pid_t target = static_cast<pid_t>(pid);
    // Group leader we spawned: signal the whole group
    if (::getpgid(target) == target && ::kill(-target, sig) == 0) {
        return true;
    }
    return ::kill(target, sig) == 0;
#endif
}

std::vector<ProcessInfo> listProcesses() {
    std::vector<ProcessInfo> processes;

#ifdef _WIN32
    raii::KernelHandle snapshot(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
    if (!snapshot) {
        return processes;
    }

    PROCESSENTRY32W pe32;
    pe32.dwSize = sizeof(PROCESSENTRY32W);
    if (!Process32FirstW(snapshot.get(), &pe32)) {
        return processes;
    }

    do {
        ProcessInfo info;
        info.processId = pe32.th32ProcessID;
        info.name = toUtf8(pe32.szExeFile);

        raii::KernelHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE,
                                               pe32.th32ProcessID));
        if (process) {
            wchar_t path[MAX_PATH];
            DWORD size = MAX_PATH;
            if (QueryFullProcessImageNameW(process.get(), 0, path, &size)) {
                info.executablePath = toUtf8(path);
            }
            FILETIME created, exited, kernel, user;
            if (GetProcessTimes(process.get(), &created, &exited, &kernel, &user)) {
                info.startTime = fileTimeToTimePoint(created);
            }
        }
        processes.push_back(info);
    } while (Process32NextW(snapshot.get(), &pe32));
#else
    DIR* proc = ::opendir("/proc");
    if (!proc) {
        return processes;
    }
    raii::HandleWrapper<DIR*, nullptr> procDir(proc, [](DIR* d) { ::closedir(d); });

    const auto boot = bootTime();
    const long ticksPerSecond = ::sysconf(_SC_CLK_TCK);

    struct dirent* entry;
    while ((entry = ::readdir(procDir.get())) != nullptr) {
        const char* name = entry->d_name;
        if (name[0] == '\0' || std::strspn(name, "0123456789") != std::strlen(name)) {
            continue;
        }

        ProcessInfo info;
        info.processId = static_cast<ProcessId>(std::stoul(name));

        ProcStat stat;
        if (!readProcStat(info.processId, stat) || stat.state == 'Z') {
            continue;
        }

        info.executablePath = readExeLink(info.processId);
        if (!info.executablePath.empty()) {
            size_t slash = info.executablePath.find_last_of('/');
            info.name = info.executablePath.substr(slash == std::string::npos ? 0 : slash + 1);
        } else {
            info.name = stat.comm;
        }

        if (ticksPerSecond > 0) {
            auto offset = std::chrono::milliseconds(
                static_cast<long long>(stat.startTicks * 1000ULL / static_cast<unsigned long long>(ticksPerSecond)));
            info.startTime = boot + std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
        }
        processes.push_back(info);
    }
#endif

    return processes;
}

} // namespace process
} // namespace ocal
} // namespace marionette
