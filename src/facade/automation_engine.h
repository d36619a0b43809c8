#ifndef MARIONETTE_AUTOMATION_ENGINE_H
#define MARIONETTE_AUTOMATION_ENGINE_H

#include <memory>
#include "application_facade.h"
#include "engine_settings.h"
#include "../ocal/desktop_backend.h"
#include "../ocal/screen_capture.h"
#include "../ocr/ocr_backend.h"

namespace marionette {

class ConfigManager;

namespace facade {

/**
 * @brief Wires the engine components together from one set of settings
 *
 * Without explicit backends the platform desktop backend and the tesseract
 * command line are used. On destruction every registered application is
 * terminated and, if an evidence file is configured, the evidence is written.
 */
class AutomationEngine {
public:
    explicit AutomationEngine(const EngineSettings& settings,
                              std::shared_ptr<ocal::DesktopBackend> desktop = nullptr,
                              std::shared_ptr<ocr::OcrBackend> ocrBackend = nullptr);
    ~AutomationEngine();

    AutomationEngine(const AutomationEngine&) = delete;
    AutomationEngine& operator=(const AutomationEngine&) = delete;

    // Applies the logging section, then builds the engine
    static std::unique_ptr<AutomationEngine> fromConfig(const ConfigManager& config);

    ApplicationFacade& facade() { return *m_facade; }
    registry::ApplicationRegistry& registry() { return *m_registry; }
    vision::TemplateCache& templates() { return *m_templates; }
    evidence::EvidenceRecorder& evidence() { return *m_recorder; }
    const EngineSettings& settings() const { return m_settings; }

    // Evidence report plus the per-operation timings, written to the configured evidence file
    bool writeEvidence() const;

private:
    EngineSettings m_settings;
    std::shared_ptr<ocal::DesktopBackend> m_desktop;
    std::shared_ptr<ocal::ScreenCapture> m_capture;
    std::shared_ptr<registry::ApplicationRegistry> m_registry;
    std::shared_ptr<vision::TemplateCache> m_templates;
    std::shared_ptr<vision::ImageMatcher> m_matcher;
    std::shared_ptr<ocr::OcrEngine> m_ocr;
    std::shared_ptr<evidence::EvidenceRecorder> m_recorder;
    std::unique_ptr<ApplicationFacade> m_facade;
};

} // namespace facade
} // namespace marionette

#endif // MARIONETTE_AUTOMATION_ENGINE_H
