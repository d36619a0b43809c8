#ifndef MARIONETTE_SCENARIO_CONTEXT_H
#define MARIONETTE_SCENARIO_CONTEXT_H

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application_facade.h"

namespace marionette {
namespace facade {

/**
 * @brief State of one running test scenario
 *
 * Carries the scenario's default application, so steps may omit the name,
 * and the applications the scenario started, which cleanup() (and the
 * destructor) terminate. Not shared between scenarios.
 *
 * Every wait a shorthand starts observes the scenario's cancellation token.
 * cleanup() may be called from another thread (a test runner's timeout
 * handler): it cancels the token first, so a step blocked in a wait returns
 * and releases its application before the applications are terminated.
 * Once cleaned up, the scenario's waits end at once.
 */
class ScenarioContext {
public:
    explicit ScenarioContext(ApplicationFacade& facade, std::string scenarioName = "");
    ~ScenarioContext();

    ScenarioContext(const ScenarioContext&) = delete;
    ScenarioContext& operator=(const ScenarioContext&) = delete;

    const std::string& scenarioName() const { return m_scenarioName; }

    void setDefaultApplication(const std::string& logicalName);
    bool hasDefaultApplication() const;

    /**
     * @brief logicalName, or the default application when it is empty
     * @throws NotFoundError if neither is set
     */
    std::string application(const std::string& logicalName = "") const;

    /**
     * @brief Launch through the registry and own the result; the first
     * application launched becomes the default
     */
    registry::ManagedApplication launch(const std::string& command,
                                        const std::vector<std::string>& arguments,
                                        const std::string& logicalName);

    // Terminate logicalName during cleanup
    void manage(const std::string& logicalName);

    // Cancels pending waits, then terminates every managed application, best effort; safe to call twice
    void cleanup();

    const sync::CancellationToken& cancellation() const { return m_cancellation; }
    bool isCancelled() const { return m_cancellation.isCancelled(); }

    // Default-application shorthands
    void click(const ocal::Point& point);
    void click(const std::string& templatePath);
    void typeText(const std::string& text);
    void pressKey(const std::string& keyCombo);
    void assertVisibleText(const std::string& expected,
                           const std::optional<sync::WaitPolicy>& policy = std::nullopt);
    void assertImagePresent(const std::string& templatePath,
                            const std::optional<sync::WaitPolicy>& policy = std::nullopt);
    std::string saveScreenshot(const std::string& label);

    ApplicationFacade& facade() { return m_facade; }

private:
    ApplicationFacade& m_facade;
    std::string m_scenarioName;
    sync::CancellationToken m_cancellation;

    mutable std::mutex m_mutex;
    std::string m_defaultApplication;
    std::vector<std::string> m_managed;
};

} // namespace facade
} // namespace marionette

#endif // MARIONETTE_SCENARIO_CONTEXT_H
