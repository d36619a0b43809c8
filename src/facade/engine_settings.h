#ifndef MARIONETTE_ENGINE_SETTINGS_H
#define MARIONETTE_ENGINE_SETTINGS_H

#include <string>
#include <vector>
#include "../common/structured_logger.h"
#include "../ocr/ocr_engine.h"
#include "../registry/application_registry.h"
#include "../sync/wait_condition.h"

namespace marionette {

class ConfigManager;

namespace facade {

/**
 * @brief Everything the engine reads from configuration, resolved once
 */
struct EngineSettings {
    double similarityThreshold;
    std::vector<double> scaleFactors;

    ocr::OcrSettings ocr;
    std::string tesseractExecutable;
    int ocrTimeoutMs;

    sync::WaitPolicy waitPolicy;
    registry::RegistrySettings registry;

    std::string screenshotDirectory;
    std::string templateDirectory;
    std::string evidenceFile;   // empty: evidence is not written on shutdown

    LoggingSettings logging;

    EngineSettings();

    /**
     * @throws ConfigurationError for values outside their valid range
     */
    static EngineSettings fromConfig(const ConfigManager& config);
};

LoggingSettings loggingSettingsFromConfig(const ConfigManager& config);

} // namespace facade
} // namespace marionette

#endif // MARIONETTE_ENGINE_SETTINGS_H
