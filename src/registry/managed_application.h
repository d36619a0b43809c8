#ifndef MARIONETTE_MANAGED_APPLICATION_H
#define MARIONETTE_MANAGED_APPLICATION_H

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../ocal/desktop_backend.h"

namespace marionette {
namespace registry {

/**
 * LAUNCHING -> RUNNING -> TERMINATED. SUSPENDED is only ever observed
 * (the OS reports the process as not responding) and turns back into
 * RUNNING once it responds again. Nothing leaves TERMINATED.
 */
enum class ApplicationState {
    LAUNCHING,
    RUNNING,
    SUSPENDED,
    TERMINATED
};

std::string applicationStateToString(ApplicationState state);

/**
 * @brief Snapshot of a registered application
 *
 * The registry owns the live record; callers only ever get copies.
 */
struct ManagedApplication {
    std::string logicalName;
    ocal::ProcessId processId;
    ocal::WindowHandle primaryWindow;
    std::vector<ocal::WindowHandle> secondaryWindows;
    std::string launchCommand;
    std::vector<std::string> launchArguments;
    std::string executablePath;
    ApplicationState state;
    std::chrono::system_clock::time_point registeredAt;
    std::chrono::system_clock::time_point lastFocused;   // epoch until first focus
    bool externallyStarted;

    ManagedApplication()
        : processId(0), primaryWindow(ocal::INVALID_WINDOW_HANDLE),
          state(ApplicationState::LAUNCHING), externallyStarted(false) {}

    bool isAlive() const {
        return state == ApplicationState::RUNNING || state == ApplicationState::SUSPENDED;
    }

    nlohmann::json toJson() const;
};

} // namespace registry
} // namespace marionette

#endif // MARIONETTE_MANAGED_APPLICATION_H
