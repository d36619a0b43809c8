#include "scenario_context.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace marionette {
namespace facade {

ScenarioContext::ScenarioContext(ApplicationFacade& facade, std::string scenarioName)
    : m_facade(facade), m_scenarioName(std::move(scenarioName)) {}

ScenarioContext::~ScenarioContext() {
    try {
        cleanup();
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Scenario cleanup failed")
            .context("scenario", m_scenarioName)
            .context("error", e.what());
    }
}

void ScenarioContext::setDefaultApplication(const std::string& logicalName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_defaultApplication = logicalName;
}

bool ScenarioContext::hasDefaultApplication() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_defaultApplication.empty();
}

std::string ScenarioContext::application(const std::string& logicalName) const {
    if (!logicalName.empty()) {
        return logicalName;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_defaultApplication.empty()) {
        throw NotFoundError("No application named and no default application set", m_scenarioName);
    }
    return m_defaultApplication;
}

registry::ManagedApplication ScenarioContext::launch(const std::string& command,
                                                     const std::vector<std::string>& arguments,
                                                     const std::string& logicalName) {
    registry::ManagedApplication application =
        m_facade.registry().launch(command, arguments, logicalName, "", &m_cancellation);
    manage(logicalName);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_defaultApplication.empty()) {
        m_defaultApplication = logicalName;
    }
    return application;
}

void ScenarioContext::manage(const std::string& logicalName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_managed.begin(), m_managed.end(), logicalName) == m_managed.end()) {
        m_managed.push_back(logicalName);
    }
}

void ScenarioContext::cleanup() {
    m_cancellation.cancel();

    std::vector<std::string> managed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        managed.swap(m_managed);
        m_defaultApplication.clear();
    }

    // Reverse launch order
    for (auto it = managed.rbegin(); it != managed.rend(); ++it) {
        try {
            m_facade.registry().terminate(*it, true);
        } catch (const std::exception& e) {
            ErrorHandler::getInstance().handleException(e, m_scenarioName + ":" + *it);
        }
    }
    if (!managed.empty()) {
        SLOG_INFO().message("Scenario cleaned up")
            .context("scenario", m_scenarioName)
            .context("applications", managed);
    }
}

void ScenarioContext::click(const ocal::Point& point) {
    m_facade.click(application(), point);
}

void ScenarioContext::click(const std::string& templatePath) {
    m_facade.click(application(), templatePath, std::nullopt, &m_cancellation);
}

void ScenarioContext::typeText(const std::string& text) {
    m_facade.typeText(application(), text);
}

void ScenarioContext::pressKey(const std::string& keyCombo) {
    m_facade.pressKey(application(), keyCombo);
}

void ScenarioContext::assertVisibleText(const std::string& expected,
                                        const std::optional<sync::WaitPolicy>& policy) {
    m_facade.assertVisibleText(application(), expected, policy, &m_cancellation);
}

void ScenarioContext::assertImagePresent(const std::string& templatePath,
                                         const std::optional<sync::WaitPolicy>& policy) {
    m_facade.assertImagePresent(application(), templatePath, policy, &m_cancellation);
}

std::string ScenarioContext::saveScreenshot(const std::string& label) {
    return m_facade.saveScreenshot(application(), label);
}

} // namespace facade
} // namespace marionette
