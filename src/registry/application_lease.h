#ifndef MARIONETTE_APPLICATION_LEASE_H
#define MARIONETTE_APPLICATION_LEASE_H

#include <string>
#include <vector>
#include "application_registry.h"

namespace marionette {
namespace registry {

/**
 * @brief Scoped ownership of a registered application
 *
 * The application is terminated when the lease goes out of scope, including
 * on the error path, unless release() was called first. The registry must
 * outlive the lease.
 */
class ApplicationLease {
public:
    // Takes over an application that is already registered; NotFoundError otherwise
    ApplicationLease(ApplicationRegistry& registry, std::string logicalName);
    ~ApplicationLease();

    ApplicationLease(ApplicationLease&& other) noexcept;
    ApplicationLease(const ApplicationLease&) = delete;
    ApplicationLease& operator=(const ApplicationLease&) = delete;
    ApplicationLease& operator=(ApplicationLease&&) = delete;

    static ApplicationLease launch(ApplicationRegistry& registry,
                                   const std::string& command,
                                   const std::vector<std::string>& arguments,
                                   const std::string& logicalName);

    const std::string& name() const { return m_logicalName; }
    ManagedApplication application() const;

    // Keep the application running past the lease
    void release() noexcept { m_released = true; }
    bool released() const { return m_released; }

private:
    ApplicationRegistry* m_registry;
    std::string m_logicalName;
    bool m_released;
};

} // namespace registry
} // namespace marionette

#endif // MARIONETTE_APPLICATION_LEASE_H
