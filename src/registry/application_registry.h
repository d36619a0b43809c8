#ifndef MARIONETTE_APPLICATION_REGISTRY_H
#define MARIONETTE_APPLICATION_REGISTRY_H

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "managed_application.h"
#include "process_matcher.h"
#include "../ocal/desktop_backend.h"
#include "../ocal/screen_capture.h"
#include "../sync/wait_condition.h"

namespace marionette {

class ConfigManager;

namespace registry {

struct RegistrySettings {
    std::chrono::milliseconds launchTimeout;
    std::chrono::milliseconds terminateGrace;
    std::chrono::milliseconds registrationTimeout;
    std::chrono::milliseconds geometryTimeout;
    std::chrono::milliseconds focusTimeout;
    std::chrono::milliseconds pollInterval;
    std::chrono::milliseconds geometryPollInterval;
    int maxRetries;   // re-activations after the first focus attempt

    RegistrySettings()
        : launchTimeout(30000), terminateGrace(5000), registrationTimeout(5000),
          geometryTimeout(2000), focusTimeout(5000), pollInterval(500),
          geometryPollInterval(100), maxRetries(3) {}

    static RegistrySettings fromConfig(const ConfigManager& config);
};

/**
 * @brief Holds an application's mutex for as long as it lives
 *
 * Recursive, so registry operations called while a facade operation holds
 * the lock on the same thread do not deadlock.
 */
class ApplicationLock {
public:
    explicit ApplicationLock(std::shared_ptr<std::recursive_mutex> mutex)
        : m_mutex(std::move(mutex)), m_lock(*m_mutex) {}

    ApplicationLock(ApplicationLock&&) = default;

private:
    std::shared_ptr<std::recursive_mutex> m_mutex;
    std::unique_lock<std::recursive_mutex> m_lock;
};

/**
 * @brief Lifecycle and identity of the applications under test, keyed by logical name
 *
 * Window and process handles are weak: every lookup re-validates them
 * against the OS. An exited process is noticed on the next access and its
 * entry evicted. The destructor terminates whatever is still registered.
 */
class ApplicationRegistry {
public:
    ApplicationRegistry(std::shared_ptr<ocal::DesktopBackend> backend,
                        std::shared_ptr<ocal::ScreenCapture> capture,
                        RegistrySettings settings = RegistrySettings());
    ~ApplicationRegistry();

    ApplicationRegistry(const ApplicationRegistry&) = delete;
    ApplicationRegistry& operator=(const ApplicationRegistry&) = delete;

    /**
     * @brief Start command and register it once a visible window appears
     *
     * command may be an absolute path, a path relative to the working
     * directory, or a bare name looked up on PATH.
     * @throws LaunchError if the executable is missing, the name is taken,
     *         the process exits early, no window shows up in time or the
     *         wait for the window is cancelled. The spawned process is
     *         killed and the name released in every case.
     */
    ManagedApplication launch(const std::string& command,
                              const std::vector<std::string>& arguments,
                              const std::string& logicalName,
                              const std::string& workingDirectory = "",
                              const sync::CancellationToken* cancellation = nullptr);

    /**
     * @brief Adopt a process that was started outside the engine
     * @throws RegistrationError when nothing matches, the match is ambiguous,
     *         the process is already registered (or being registered by
     *         another thread) or shows no window in time
     */
    ManagedApplication registerExistingProcess(const ProcessMatcher& matcher,
                                               const std::string& logicalName,
                                               const sync::CancellationToken* cancellation = nullptr);

    /**
     * @brief Current snapshot of a live application
     * @throws NotFoundError if the name is unknown or its process has exited
     */
    ManagedApplication resolve(const std::string& logicalName);

    void focus(const std::string& logicalName);
    // Restores a minimized window before focusing it
    void switchTo(const std::string& logicalName);

    /**
     * @brief Close the application and forget it
     *
     * graceful asks the windows to close and waits the grace period before
     * killing; otherwise the process is killed outright. Cancelling the token
     * cuts the grace period short and goes straight to the kill. Unknown
     * names are ignored.
     */
    void terminate(const std::string& logicalName, bool graceful = true,
                   const sync::CancellationToken* cancellation = nullptr);
    void terminateAll();

    // Visible windows of the process other than the primary one
    std::vector<ocal::WindowInfo> listSecondaryWindows(const std::string& logicalName);

    /**
     * @brief Window 0 is the primary window, 1.. the secondary windows
     * @throws WindowOperationError if there is no window at index
     */
    ocal::WindowInfo windowByIndex(const std::string& logicalName, size_t index);
    void switchToWindow(const std::string& logicalName, size_t index);

    // Primary window geometry; each change is verified and throws
    // WindowOperationError when the window does not reach the requested state
    void move(const std::string& logicalName, int x, int y);
    void resize(const std::string& logicalName, int width, int height);
    void maximize(const std::string& logicalName);
    void minimize(const std::string& logicalName);
    void restore(const std::string& logicalName);

    /**
     * @brief Primary window metadata
     * @throws WindowOperationError if the application has no open window
     */
    ocal::WindowInfo primaryWindowInfo(const std::string& logicalName);

    // Serializes operations on one application; NotFoundError for unknown names
    ApplicationLock lockApplication(const std::string& logicalName);

    std::vector<std::string> registeredNames() const;
    bool isRegistered(const std::string& logicalName) const;

    ocal::DesktopBackend& backend() { return *m_backend; }
    ocal::ScreenCapture& capture() { return *m_capture; }
    const RegistrySettings& settings() const { return m_settings; }

private:
    struct Entry {
        ManagedApplication application;
        std::shared_ptr<std::recursive_mutex> mutex;

        Entry() : mutex(std::make_shared<std::recursive_mutex>()) {}
    };
    using EntryPtr = std::shared_ptr<Entry>;

    std::shared_ptr<ocal::DesktopBackend> m_backend;
    std::shared_ptr<ocal::ScreenCapture> m_capture;
    RegistrySettings m_settings;

    mutable std::mutex m_mutex;
    std::map<std::string, EntryPtr> m_entries;

    std::string resolveExecutable(const std::string& command) const;
    // pid != 0 also claims that process; no two entries may hold the same one
    EntryPtr reserve(const std::string& logicalName, bool forLaunch, ocal::ProcessId pid = 0);
    void release(const std::string& logicalName, const EntryPtr& entry);
    EntryPtr findEntry(const std::string& logicalName) const;
    std::set<ocal::ProcessId> boundProcessIds() const;

    std::vector<ocal::WindowInfo> liveWindows(ocal::ProcessId pid);
    sync::WaitPolicy policy(std::chrono::milliseconds timeout, int maxRetries = 0) const;

    ocal::WindowInfo awaitFirstWindow(ocal::ProcessId pid, std::chrono::milliseconds timeout,
                                      const std::string& logicalName, bool launched,
                                      const sync::CancellationToken* cancellation);
    void activateWithRetry(const std::string& logicalName, ocal::WindowHandle handle);
    void changeGeometry(const std::string& logicalName, const std::string& operation,
                        const std::function<bool(ocal::WindowHandle)>& action,
                        const std::function<bool(const ocal::WindowInfo&)>& reached);
};

} // namespace registry
} // namespace marionette

#endif // MARIONETTE_APPLICATION_REGISTRY_H
