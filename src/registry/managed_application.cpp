#include "managed_application.h"

namespace marionette {
namespace registry {

std::string applicationStateToString(ApplicationState state) {
    switch (state) {
        case ApplicationState::LAUNCHING: return "LAUNCHING";
        case ApplicationState::RUNNING: return "RUNNING";
        case ApplicationState::SUSPENDED: return "SUSPENDED";
        case ApplicationState::TERMINATED: return "TERMINATED";
        default: return "UNKNOWN";
    }
}

nlohmann::json ManagedApplication::toJson() const {
    auto toMillis = [](const std::chrono::system_clock::time_point& tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    };

    return nlohmann::json{
        {"logical_name", logicalName},
        {"process_id", processId},
        {"primary_window", primaryWindow},
        {"secondary_windows", secondaryWindows},
        {"launch_command", launchCommand},
        {"launch_arguments", launchArguments},
        {"executable_path", executablePath},
        {"state", applicationStateToString(state)},
        {"registered_at_ms", toMillis(registeredAt)},
        {"last_focused_ms", toMillis(lastFocused)},
        {"externally_started", externallyStarted}
    };
}

} // namespace registry
} // namespace marionette
