#include "engine_settings.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <algorithm>

namespace marionette {
namespace facade {

namespace {
    void requirePositive(std::chrono::milliseconds value, const char* key) {
        if (value.count() <= 0) {
            throw ConfigurationError(std::string(key) + " must be positive", std::to_string(value.count()));
        }
    }
}

EngineSettings::EngineSettings()
    : similarityThreshold(0.8),
      scaleFactors{1.0},
      tesseractExecutable("tesseract"),
      ocrTimeoutMs(15000),
      screenshotDirectory("evidence/screenshots"),
      templateDirectory("templates") {}

EngineSettings EngineSettings::fromConfig(const ConfigManager& config) {
    EngineSettings settings;

    settings.similarityThreshold = config.getSimilarityThreshold();
    settings.scaleFactors = config.getMatchScaleFactors();

    settings.ocr.language = config.getOcrLanguage();
    settings.ocr.minConfidence = config.getOcrConfidenceThreshold() / 100.0;
    settings.ocr.scaleFactor = config.getOcrScaleFactor();
    settings.ocr.preprocessing = config.getOcrPreprocessingEnabled();
    settings.tesseractExecutable = config.getTesseractExecutable();
    settings.ocrTimeoutMs = config.getOcrTimeoutMs();

    settings.waitPolicy = sync::WaitPolicy::fromConfig(config);
    settings.registry = registry::RegistrySettings::fromConfig(config);
    requirePositive(settings.registry.launchTimeout, "process.launch_timeout_ms");
    requirePositive(settings.registry.registrationTimeout, "process.registration_timeout_ms");
    requirePositive(settings.registry.geometryTimeout, "window.geometry_timeout_ms");
    requirePositive(settings.registry.focusTimeout, "window.focus_timeout_ms");
    if (settings.registry.terminateGrace.count() < 0) {
        throw ConfigurationError("process.terminate_grace_ms must not be negative",
                                 std::to_string(settings.registry.terminateGrace.count()));
    }

    settings.screenshotDirectory = config.getScreenshotDirectory();
    settings.templateDirectory = config.getTemplateDirectory();
    settings.evidenceFile = config.getEvidenceFile();
    settings.logging = loggingSettingsFromConfig(config);
    return settings;
}

LoggingSettings loggingSettingsFromConfig(const ConfigManager& config) {
    LoggingSettings logging;
    logging.level = parseLogLevel(config.getLogLevel(), LogLevel::INFO);
    logging.file = config.getLogFile();
    logging.maxFileSizeMb = static_cast<size_t>(std::max(1, config.getLogMaxSizeMb()));
    logging.maxFiles = static_cast<size_t>(std::max(1, config.getLogMaxFiles()));

    std::string format = utils::StringUtils::toLowerCase(config.getLogFormat());
    if (format != "text" && format != "json") {
        throw ConfigurationError("logging.format must be \"text\" or \"json\"", format);
    }
    logging.json = format == "json";
    logging.slowOperationThreshold = std::chrono::milliseconds(config.getLogSlowOperationMs());
    return logging;
}

} // namespace facade
} // namespace marionette
