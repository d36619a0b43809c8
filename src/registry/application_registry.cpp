#include "application_registry.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include "../common/raii_wrappers.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace marionette {
namespace registry {

namespace {
    std::string describeWindow(const ocal::WindowInfo& info) {
        std::ostringstream ss;
        ss << "window '" << info.title << "' " << info.bounds.toString()
           << " visible=" << info.isVisible
           << " minimized=" << info.isMinimized
           << " maximized=" << info.isMaximized;
        return ss.str();
    }

    std::string millisText(std::chrono::milliseconds ms) {
        return std::to_string(ms.count()) + " ms";
    }

    bool hasPathSeparator(const std::string& command) {
#ifdef _WIN32
        return command.find_first_of("/\\") != std::string::npos;
#else
        return command.find('/') != std::string::npos;
#endif
    }
}

RegistrySettings RegistrySettings::fromConfig(const ConfigManager& config) {
    RegistrySettings settings;
    settings.launchTimeout = std::chrono::milliseconds(config.getLaunchTimeoutMs());
    settings.terminateGrace = std::chrono::milliseconds(config.getTerminateGraceMs());
    settings.registrationTimeout = std::chrono::milliseconds(config.getRegistrationTimeoutMs());
    settings.geometryTimeout = std::chrono::milliseconds(config.getGeometryTimeoutMs());
    settings.focusTimeout = std::chrono::milliseconds(config.getFocusTimeoutMs());
    settings.pollInterval = std::chrono::milliseconds(config.getPollIntervalMs());
    settings.maxRetries = config.getMaxRetries();
    return settings;
}

ApplicationRegistry::ApplicationRegistry(std::shared_ptr<ocal::DesktopBackend> backend,
                                         std::shared_ptr<ocal::ScreenCapture> capture,
                                         RegistrySettings settings)
    : m_backend(std::move(backend)), m_capture(std::move(capture)), m_settings(std::move(settings)) {
    if (!m_backend || !m_capture) {
        throw std::invalid_argument("ApplicationRegistry requires a desktop backend and a screen capture");
    }
}

ApplicationRegistry::~ApplicationRegistry() {
    try {
        terminateAll();
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Cleanup of registered applications failed").context("error", e.what());
    }
}

std::string ApplicationRegistry::resolveExecutable(const std::string& command) const {
    std::string expanded = os::PathUtils::expandUserHome(command);
    if (expanded.empty()) {
        throw LaunchError("Launch command must not be empty");
    }

    std::string candidate;
    if (os::PathUtils::isAbsolute(expanded) || hasPathSeparator(expanded)) {
        std::error_code ec;
        std::filesystem::path absolute = std::filesystem::absolute(expanded, ec);
        candidate = ec ? expanded : absolute.string();
    } else {
        candidate = os::PathUtils::findOnSearchPath(expanded);
    }

    if (candidate.empty() || !os::PathUtils::isFile(candidate)) {
        throw LaunchError("Executable not found", candidate.empty() ? "searched PATH" : candidate, command);
    }
    if (!os::PathUtils::isExecutable(candidate)) {
        throw LaunchError("File is not executable", candidate, command);
    }
    return candidate;
}

ApplicationRegistry::EntryPtr ApplicationRegistry::reserve(const std::string& logicalName, bool forLaunch,
                                                            ocal::ProcessId pid) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(logicalName);
    if (it != m_entries.end()) {
        const ManagedApplication& existing = it->second->application;
        bool held = existing.state == ApplicationState::LAUNCHING ||
                    m_backend->isProcessRunning(existing.processId);
        if (held) {
            std::string details = "pid " + std::to_string(existing.processId) + ", state " +
                                  applicationStateToString(existing.state);
            if (forLaunch) {
                throw LaunchError("Logical name is already in use", details, logicalName);
            }
            throw RegistrationError("Logical name is already in use", details, logicalName);
        }
        // The previous holder exited without anyone noticing
        it->second->application.state = ApplicationState::TERMINATED;
        m_entries.erase(it);
    }

    if (pid != 0) {
        for (const auto& other : m_entries) {
            const ManagedApplication& holder = other.second->application;
            if (holder.processId == pid &&
                (holder.state == ApplicationState::LAUNCHING || m_backend->isProcessRunning(pid))) {
                throw RegistrationError("Process is already registered",
                                        "pid " + std::to_string(pid) + " as '" + other.first + "'",
                                        logicalName);
            }
        }
    }

    auto entry = std::make_shared<Entry>();
    entry->application.logicalName = logicalName;
    entry->application.processId = pid;
    entry->application.state = ApplicationState::LAUNCHING;
    m_entries.emplace(logicalName, entry);
    return entry;
}

void ApplicationRegistry::release(const std::string& logicalName, const EntryPtr& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(logicalName);
    if (it != m_entries.end() && it->second == entry) {
        entry->application.state = ApplicationState::TERMINATED;
        m_entries.erase(it);
    }
}

ApplicationRegistry::EntryPtr ApplicationRegistry::findEntry(const std::string& logicalName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(logicalName);
    return it == m_entries.end() ? nullptr : it->second;
}

std::set<ocal::ProcessId> ApplicationRegistry::boundProcessIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<ocal::ProcessId> pids;
    for (const auto& entry : m_entries) {
        if (entry.second->application.processId != 0) {
            pids.insert(entry.second->application.processId);
        }
    }
    return pids;
}

std::vector<ocal::WindowInfo> ApplicationRegistry::liveWindows(ocal::ProcessId pid) {
    std::vector<ocal::WindowInfo> windows;
    for (const auto& info : m_backend->enumerateWindows(pid)) {
        if (info.isVisible || info.isMinimized) {
            windows.push_back(info);
        }
    }
    return windows;
}

sync::WaitPolicy ApplicationRegistry::policy(std::chrono::milliseconds timeout, int maxRetries) const {
    return sync::WaitPolicy(timeout, m_settings.pollInterval, sync::BackoffMode::FIXED, maxRetries);
}

ocal::WindowInfo ApplicationRegistry::awaitFirstWindow(ocal::ProcessId pid, std::chrono::milliseconds timeout,
                                                       const std::string& logicalName, bool launched,
                                                       const sync::CancellationToken* cancellation) {
    const std::string pidText = "pid " + std::to_string(pid);
    std::optional<ocal::WindowInfo> window;

    sync::WaitResult result = sync::awaitCondition(sync::Probe([&]() {
        for (const auto& info : m_backend->enumerateWindows(pid)) {
            if (info.isVisible) {
                window = info;
                return sync::ProbeResult(true, describeWindow(info));
            }
        }
        if (!m_backend->isProcessRunning(pid)) {
            if (launched) {
                throw LaunchError("Process exited before showing a window", pidText, logicalName);
            }
            throw RegistrationError("Process exited before it could be registered", pidText, logicalName);
        }
        return sync::ProbeResult(false, "no visible window yet");
    }), policy(timeout), cancellation);

    if (!result.satisfied) {
        std::string message = result.cancelled ? "Cancelled while waiting for a window"
                                               : "No window appeared within " + millisText(timeout);
        if (launched) {
            throw LaunchError(message, pidText + ", " + result.lastObservedState, logicalName);
        }
        throw RegistrationError(message, pidText + ", " + result.lastObservedState, logicalName);
    }
    return *window;
}

ManagedApplication ApplicationRegistry::launch(const std::string& command,
                                               const std::vector<std::string>& arguments,
                                               const std::string& logicalName,
                                               const std::string& workingDirectory,
                                               const sync::CancellationToken* cancellation) {
    if (logicalName.empty()) {
        throw LaunchError("Logical name must not be empty", "", command);
    }
    SCOPED_TIMER("application_launch");

    std::string executable = resolveExecutable(command);
    EntryPtr entry = reserve(logicalName, true);
    ApplicationLock launching(entry->mutex);
    raii::ScopeGuard releaseName([this, &logicalName, entry]() { release(logicalName, entry); });

    SLOG_INFO().message("Launching application")
        .application(logicalName)
        .context("executable", executable)
        .context("arguments", arguments);

    ocal::ProcessId pid = m_backend->spawnProcess(executable, arguments, workingDirectory);
    raii::ScopeGuard killProcess([this, pid, &logicalName]() {
        if (!m_backend->killProcess(pid, true)) {
            SLOG_WARNING().message("Could not kill process of failed launch")
                .application(logicalName)
                .context("pid", pid);
        }
    });

    ocal::WindowInfo window = awaitFirstWindow(pid, m_settings.launchTimeout, logicalName, true, cancellation);

    ManagedApplication application;
    application.logicalName = logicalName;
    application.processId = pid;
    application.primaryWindow = window.handle;
    for (const auto& info : liveWindows(pid)) {
        if (info.handle != window.handle) {
            application.secondaryWindows.push_back(info.handle);
        }
    }
    application.launchCommand = command;
    application.launchArguments = arguments;
    application.executablePath = executable;
    application.state = ApplicationState::RUNNING;
    application.registeredAt = std::chrono::system_clock::now();
    application.externallyStarted = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry->application = application;
    }
    killProcess.dismiss();
    releaseName.dismiss();

    SLOG_INFO().message("Application launched")
        .application(logicalName)
        .context("pid", pid)
        .context("window", window.title);
    return application;
}

ManagedApplication ApplicationRegistry::registerExistingProcess(const ProcessMatcher& matcher,
                                                                const std::string& logicalName,
                                                                const sync::CancellationToken* cancellation) {
    if (logicalName.empty()) {
        throw RegistrationError("Logical name must not be empty", matcher.describe());
    }

    std::set<ocal::ProcessId> bound = boundProcessIds();
    if (matcher.isPidMatcher() && bound.count(matcher.pid()) > 0) {
        throw RegistrationError("Process is already registered", matcher.describe(), logicalName);
    }

    std::vector<ocal::ProcessInfo> candidates = matcher.select(m_backend->listProcesses(), bound);
    if (candidates.empty()) {
        throw RegistrationError("No running process matches", matcher.describe(), logicalName);
    }
    if (candidates.size() > 1 && !matcher.prefersNewest()) {
        std::ostringstream pids;
        for (size_t i = 0; i < candidates.size(); ++i) {
            pids << (i == 0 ? "" : ", ") << candidates[i].processId;
        }
        throw RegistrationError("Several processes match; select by PID or ask for the newest",
                                matcher.describe() + ": " + pids.str(), logicalName);
    }

    const ocal::ProcessInfo chosen = *std::max_element(
        candidates.begin(), candidates.end(),
        [](const ocal::ProcessInfo& a, const ocal::ProcessInfo& b) {
            if (a.startTime != b.startTime) {
                return a.startTime < b.startTime;
            }
            return a.processId < b.processId;
        });

    // Claims the PID too, so a concurrent registration of the same process fails here
    EntryPtr entry = reserve(logicalName, false, chosen.processId);
    ApplicationLock registering(entry->mutex);
    raii::ScopeGuard releaseName([this, &logicalName, entry]() { release(logicalName, entry); });

    ocal::WindowInfo window = awaitFirstWindow(chosen.processId, m_settings.registrationTimeout,
                                               logicalName, false, cancellation);

    ManagedApplication application;
    application.logicalName = logicalName;
    application.processId = chosen.processId;
    application.primaryWindow = window.handle;
    for (const auto& info : liveWindows(chosen.processId)) {
        if (info.handle != window.handle) {
            application.secondaryWindows.push_back(info.handle);
        }
    }
    application.launchCommand = chosen.name;
    application.executablePath = chosen.executablePath;
    application.state = ApplicationState::RUNNING;
    application.registeredAt = std::chrono::system_clock::now();
    application.externallyStarted = true;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry->application = application;
    }
    releaseName.dismiss();

    SLOG_INFO().message("Registered running process")
        .application(logicalName)
        .context("pid", chosen.processId)
        .context("process", chosen.name)
        .context("window", window.title);
    return application;
}

ManagedApplication ApplicationRegistry::resolve(const std::string& logicalName) {
    EntryPtr entry = findEntry(logicalName);
    if (!entry) {
        throw NotFoundError("No application registered as '" + logicalName + "'", logicalName);
    }

    ManagedApplication snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = entry->application;
    }
    if (snapshot.state == ApplicationState::LAUNCHING) {
        throw NotFoundError("Application '" + logicalName + "' is still starting", logicalName);
    }

    if (!m_backend->isProcessRunning(snapshot.processId)) {
        release(logicalName, entry);
        SLOG_INFO().message("Registered application has exited")
            .application(logicalName)
            .context("pid", snapshot.processId);
        throw NotFoundError("Application '" + logicalName + "' is no longer running", logicalName);
    }

    ApplicationState observed = m_backend->isProcessResponding(snapshot.processId)
        ? ApplicationState::RUNNING : ApplicationState::SUSPENDED;

    ocal::WindowHandle primary = snapshot.primaryWindow;
    if (!m_backend->getWindowInfo(primary)) {
        std::vector<ocal::WindowInfo> windows = liveWindows(snapshot.processId);
        if (!windows.empty()) {
            primary = windows.front().handle;
            SLOG_DEBUG().message("Primary window replaced")
                .application(logicalName)
                .context("window", windows.front().title);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (observed != entry->application.state) {
            SLOG_INFO().message("Application state changed")
                .application(logicalName)
                .context("from", applicationStateToString(entry->application.state))
                .context("to", applicationStateToString(observed));
        }
        entry->application.state = observed;
        entry->application.primaryWindow = primary;
        snapshot = entry->application;
    }
    return snapshot;
}

ocal::WindowInfo ApplicationRegistry::primaryWindowInfo(const std::string& logicalName) {
    ManagedApplication application = resolve(logicalName);
    std::optional<ocal::WindowInfo> info = m_backend->getWindowInfo(application.primaryWindow);
    if (!info) {
        throw WindowOperationError("Application has no open window",
                                   "pid " + std::to_string(application.processId), logicalName);
    }
    return *info;
}

void ApplicationRegistry::activateWithRetry(const std::string& logicalName, ocal::WindowHandle handle) {
    sync::WaitResult result = sync::awaitCondition(sync::Probe([&]() {
        if (!m_backend->getWindowInfo(handle)) {
            throw WindowOperationError("Window no longer exists", std::to_string(handle), logicalName);
        }
        if (m_backend->foregroundWindow() == handle) {
            return sync::ProbeResult(true, "in foreground");
        }
        bool requested = m_backend->activateWindow(handle);
        if (m_backend->foregroundWindow() == handle) {
            return sync::ProbeResult(true, "in foreground");
        }
        return sync::ProbeResult(false, requested ? "activation requested, not yet in foreground"
                                                  : "activation rejected by the window system");
    }), policy(m_settings.focusTimeout, m_settings.maxRetries));

    if (!result.satisfied) {
        throw WindowOperationError("Could not bring the window to the foreground",
                                   result.lastObservedState + " after " + std::to_string(result.attempts) +
                                   " attempts", logicalName);
    }

    EntryPtr entry = findEntry(logicalName);
    if (entry) {
        std::lock_guard<std::mutex> lock(m_mutex);
        entry->application.lastFocused = std::chrono::system_clock::now();
    }
    SLOG_DEBUG().message("Window focused")
        .application(logicalName)
        .context("attempts", result.attempts);
}

void ApplicationRegistry::focus(const std::string& logicalName) {
    ApplicationLock lock = lockApplication(logicalName);
    ManagedApplication application = resolve(logicalName);
    activateWithRetry(logicalName, application.primaryWindow);
}

void ApplicationRegistry::switchTo(const std::string& logicalName) {
    ApplicationLock lock = lockApplication(logicalName);
    if (primaryWindowInfo(logicalName).isMinimized) {
        restore(logicalName);
    }
    focus(logicalName);
}

void ApplicationRegistry::terminate(const std::string& logicalName, bool graceful,
                                    const sync::CancellationToken* cancellation) {
    EntryPtr entry = findEntry(logicalName);
    if (!entry) {
        SLOG_DEBUG().message("Nothing to terminate").application(logicalName);
        return;
    }

    ApplicationLock lock(entry->mutex);
    if (findEntry(logicalName) != entry) {
        return;  // terminated while we waited for the lock
    }
    SCOPED_TIMER("application_terminate");

    ManagedApplication snapshot;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        snapshot = entry->application;
    }
    const ocal::ProcessId pid = snapshot.processId;
    auto stillRunning = [this, pid]() { return m_backend->isProcessRunning(pid); };

    if (pid != 0 && stillRunning()) {
        bool exited = false;
        if (graceful) {
            bool closeRequested = false;
            for (const auto& window : liveWindows(pid)) {
                closeRequested = m_backend->closeWindow(window.handle) || closeRequested;
            }
            if (!closeRequested && !m_backend->killProcess(pid, false)) {
                SLOG_WARNING().message("Graceful shutdown request was rejected")
                    .application(logicalName)
                    .context("pid", pid);
            }
            exited = sync::awaitConditionFalse(stillRunning, policy(m_settings.terminateGrace),
                                               cancellation).satisfied;
            if (!exited) {
                SLOG_WARNING().message("Application ignored the close request; killing it")
                    .application(logicalName)
                    .context("grace_ms", m_settings.terminateGrace.count());
            }
        }
        if (!exited) {
            if (!m_backend->killProcess(pid, true)) {
                SLOG_WARNING().message("Kill request was rejected")
                    .application(logicalName)
                    .context("pid", pid);
            }
            if (!sync::awaitConditionFalse(stillRunning, policy(m_settings.terminateGrace)).satisfied) {
                MARIONETTE_HANDLE_ERROR(ErrorType::OS_OPERATION_ERROR, ErrorSeverity::HIGH,
                                        "Process survived a forced kill",
                                        "pid " + std::to_string(pid), logicalName);
            }
        }
    }

    release(logicalName, entry);
    SLOG_INFO().message("Application terminated")
        .application(logicalName)
        .context("pid", pid)
        .context("graceful", graceful);
}

void ApplicationRegistry::terminateAll() {
    for (const auto& name : registeredNames()) {
        try {
            terminate(name, true);
        } catch (const std::exception& e) {
            ErrorHandler::getInstance().handleException(e, name);
        }
    }
}

std::vector<ocal::WindowInfo> ApplicationRegistry::listSecondaryWindows(const std::string& logicalName) {
    ApplicationLock lock = lockApplication(logicalName);
    ManagedApplication application = resolve(logicalName);

    std::vector<ocal::WindowInfo> secondary;
    std::vector<ocal::WindowHandle> handles;
    for (const auto& info : liveWindows(application.processId)) {
        if (info.handle != application.primaryWindow) {
            secondary.push_back(info);
            handles.push_back(info.handle);
        }
    }

    EntryPtr entry = findEntry(logicalName);
    if (entry) {
        std::lock_guard<std::mutex> guard(m_mutex);
        entry->application.secondaryWindows = handles;
    }
    return secondary;
}

ocal::WindowInfo ApplicationRegistry::windowByIndex(const std::string& logicalName, size_t index) {
    ApplicationLock lock = lockApplication(logicalName);
    if (index == 0) {
        return primaryWindowInfo(logicalName);
    }
    std::vector<ocal::WindowInfo> secondary = listSecondaryWindows(logicalName);
    if (index > secondary.size()) {
        throw WindowOperationError("No window at index " + std::to_string(index),
                                   std::to_string(secondary.size() + 1) + " windows open", logicalName);
    }
    return secondary[index - 1];
}

void ApplicationRegistry::switchToWindow(const std::string& logicalName, size_t index) {
    ApplicationLock lock = lockApplication(logicalName);
    ocal::WindowInfo window = windowByIndex(logicalName, index);
    if (window.isMinimized) {
        bool restored;
        {
            auto quiet = m_capture->quiesce();
            restored = m_backend->restoreWindow(window.handle);
        }
        if (!restored) {
            throw WindowOperationError("Window system rejected restore", describeWindow(window), logicalName);
        }
    }
    activateWithRetry(logicalName, window.handle);
}

void ApplicationRegistry::changeGeometry(const std::string& logicalName, const std::string& operation,
                                         const std::function<bool(ocal::WindowHandle)>& action,
                                         const std::function<bool(const ocal::WindowInfo&)>& reached) {
    ApplicationLock lock = lockApplication(logicalName);
    ocal::WindowInfo window = primaryWindowInfo(logicalName);

    bool issued;
    {
        auto quiet = m_capture->quiesce();
        issued = action(window.handle);
    }
    if (!issued) {
        throw WindowOperationError("Window system rejected " + operation, describeWindow(window), logicalName);
    }

    sync::WaitResult result = sync::awaitCondition(sync::Probe([&]() {
        std::optional<ocal::WindowInfo> info = m_backend->getWindowInfo(window.handle);
        if (!info) {
            throw WindowOperationError("Window closed during " + operation, "", logicalName);
        }
        return sync::ProbeResult(reached(*info), describeWindow(*info));
    }), sync::WaitPolicy(m_settings.geometryTimeout, m_settings.geometryPollInterval));

    if (!result.satisfied) {
        throw WindowOperationError(operation + " did not take effect within " +
                                   millisText(m_settings.geometryTimeout),
                                   result.lastObservedState, logicalName);
    }
    SLOG_DEBUG().message("Window geometry changed")
        .application(logicalName)
        .context("operation", operation)
        .context("state", result.lastObservedState);
}

void ApplicationRegistry::move(const std::string& logicalName, int x, int y) {
    changeGeometry(logicalName, "move",
        [this, x, y](ocal::WindowHandle handle) { return m_backend->moveWindow(handle, x, y); },
        [x, y](const ocal::WindowInfo& info) {
            return (info.bounds.x == x && info.bounds.y == y) ||
                   (info.clientBounds.x == x && info.clientBounds.y == y);
        });
}

void ApplicationRegistry::resize(const std::string& logicalName, int width, int height) {
    if (width <= 0 || height <= 0) {
        throw WindowOperationError("Window size must be positive",
                                   std::to_string(width) + "x" + std::to_string(height), logicalName);
    }
    changeGeometry(logicalName, "resize",
        [this, width, height](ocal::WindowHandle handle) { return m_backend->resizeWindow(handle, width, height); },
        [width, height](const ocal::WindowInfo& info) {
            return (info.bounds.width == width && info.bounds.height == height) ||
                   (info.clientBounds.width == width && info.clientBounds.height == height);
        });
}

void ApplicationRegistry::maximize(const std::string& logicalName) {
    changeGeometry(logicalName, "maximize",
        [this](ocal::WindowHandle handle) { return m_backend->maximizeWindow(handle); },
        [](const ocal::WindowInfo& info) { return info.isMaximized; });
}

void ApplicationRegistry::minimize(const std::string& logicalName) {
    changeGeometry(logicalName, "minimize",
        [this](ocal::WindowHandle handle) { return m_backend->minimizeWindow(handle); },
        [](const ocal::WindowInfo& info) { return info.isMinimized; });
}

void ApplicationRegistry::restore(const std::string& logicalName) {
    changeGeometry(logicalName, "restore",
        [this](ocal::WindowHandle handle) { return m_backend->restoreWindow(handle); },
        [](const ocal::WindowInfo& info) { return !info.isMinimized && !info.isMaximized; });
}

ApplicationLock ApplicationRegistry::lockApplication(const std::string& logicalName) {
    EntryPtr entry = findEntry(logicalName);
    if (!entry) {
        throw NotFoundError("No application registered as '" + logicalName + "'", logicalName);
    }
    return ApplicationLock(entry->mutex);
}

std::vector<std::string> ApplicationRegistry::registeredNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& entry : m_entries) {
        if (entry.second->application.state != ApplicationState::LAUNCHING) {
            names.push_back(entry.first);
        }
    }
    return names;
}

bool ApplicationRegistry::isRegistered(const std::string& logicalName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(logicalName);
    return it != m_entries.end() && it->second->application.state != ApplicationState::LAUNCHING;
}

} // namespace registry
} // namespace marionette
