#include "automation_engine.h"
#include "../common/config_manager.h"
#include "../common/file_utils.h"
#include "../common/structured_logger.h"
#include "../ocr/tesseract_cli_backend.h"

namespace marionette {
namespace facade {

AutomationEngine::AutomationEngine(const EngineSettings& settings,
                                   std::shared_ptr<ocal::DesktopBackend> desktop,
                                   std::shared_ptr<ocr::OcrBackend> ocrBackend)
    : m_settings(settings),
      m_desktop(desktop ? std::move(desktop) : ocal::createDefaultBackend()) {
    if (!ocrBackend) {
        ocrBackend = std::make_shared<ocr::TesseractCliBackend>(m_settings.tesseractExecutable,
                                                                m_settings.ocrTimeoutMs);
    }

    m_capture = std::make_shared<ocal::ScreenCapture>(m_desktop);
    m_registry = std::make_shared<registry::ApplicationRegistry>(m_desktop, m_capture, m_settings.registry);
    m_templates = std::make_shared<vision::TemplateCache>(m_settings.templateDirectory);
    m_matcher = std::make_shared<vision::ImageMatcher>(m_settings.similarityThreshold, m_settings.scaleFactors);
    m_ocr = std::make_shared<ocr::OcrEngine>(ocrBackend, m_settings.ocr);
    m_recorder = std::make_shared<evidence::EvidenceRecorder>(m_settings.screenshotDirectory);
    m_facade = std::make_unique<ApplicationFacade>(m_registry, m_templates, m_matcher, m_ocr, m_recorder,
                                                   m_settings.waitPolicy);

    SLOG_INFO().message("Automation engine ready")
        .context("desktop", m_desktop->name())
        .context("ocr", ocrBackend->name())
        .context("templates", m_settings.templateDirectory)
        .context("screenshots", m_settings.screenshotDirectory);
}

AutomationEngine::~AutomationEngine() {
    try {
        m_registry->terminateAll();
        if (!m_settings.evidenceFile.empty() && !writeEvidence()) {
            SLOG_WARNING().message("Evidence file could not be written")
                .context("path", m_settings.evidenceFile);
        }
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Engine shutdown failed").context("error", e.what());
    }
}

std::unique_ptr<AutomationEngine> AutomationEngine::fromConfig(const ConfigManager& config) {
    EngineSettings settings = EngineSettings::fromConfig(config);
    configureLogging(settings.logging);
    return std::make_unique<AutomationEngine>(settings);
}

bool AutomationEngine::writeEvidence() const {
    if (m_settings.evidenceFile.empty()) {
        return false;
    }
    if (!utils::FileUtils::ensureParentDirectoryExists(m_settings.evidenceFile)) {
        return false;
    }
    nlohmann::json report = m_recorder->toJson();
    report["timings"] = StructuredLogger::getInstance().getPerformanceTracker().toJson();
    return utils::FileUtils::saveJsonToFile(m_settings.evidenceFile, report);
}

} // namespace facade
} // namespace marionette
