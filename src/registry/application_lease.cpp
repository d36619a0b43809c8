#include "application_lease.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace marionette {
namespace registry {

ApplicationLease::ApplicationLease(ApplicationRegistry& registry, std::string logicalName)
    : m_registry(&registry), m_logicalName(std::move(logicalName)), m_released(false) {
    if (!m_registry->isRegistered(m_logicalName)) {
        throw NotFoundError("Cannot lease unregistered application '" + m_logicalName + "'", m_logicalName);
    }
}

ApplicationLease::ApplicationLease(ApplicationLease&& other) noexcept
    : m_registry(other.m_registry), m_logicalName(std::move(other.m_logicalName)),
      m_released(other.m_released) {
    other.m_released = true;
}

ApplicationLease::~ApplicationLease() {
    if (m_released) {
        return;
    }
    try {
        m_registry->terminate(m_logicalName, true);
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Leased application could not be terminated")
            .application(m_logicalName)
            .context("error", e.what());
    }
}

ApplicationLease ApplicationLease::launch(ApplicationRegistry& registry,
                                          const std::string& command,
                                          const std::vector<std::string>& arguments,
                                          const std::string& logicalName) {
    registry.launch(command, arguments, logicalName);
    return ApplicationLease(registry, logicalName);
}

ManagedApplication ApplicationLease::application() const {
    return m_registry->resolve(m_logicalName);
}

} // namespace registry
} // namespace marionette
