#ifndef MARIONETTE_CONFIG_MANAGER_H
#define MARIONETTE_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>

namespace marionette {

/**
 * @brief JSON-backed engine configuration.
 *
 * Values from a loaded file are merged over built-in defaults, so a config
 * file only needs the keys it changes. MARIONETTE_SCREENSHOT_DIR,
 * MARIONETTE_TEMPLATE_DIR and MARIONETTE_LOG_LEVEL override their keys.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    ConfigManager();

    bool loadConfig(const std::string& configPath = "config/marionette.json");
    bool saveConfig(const std::string& configPath) const;

    // Merges over the defaults; used for embedded configuration and tests
    void loadFromJson(const nlohmann::json& overrides);
    void resetToDefaults();
    nlohmann::json toJson() const;
    std::string getConfigPath() const;

    // Matching
    double getSimilarityThreshold() const;
    std::vector<double> getMatchScaleFactors() const;

    // OCR
    int getOcrConfidenceThreshold() const;   // 0-100
    std::string getOcrLanguage() const;
    double getOcrScaleFactor() const;
    bool getOcrPreprocessingEnabled() const;
    std::string getTesseractExecutable() const;
    int getOcrTimeoutMs() const;

    // Waiting
    int getDefaultTimeoutMs() const;
    int getPollIntervalMs() const;
    bool getExponentialBackoff() const;
    int getMaxRetries() const;

    // Process / window
    int getLaunchTimeoutMs() const;
    int getTerminateGraceMs() const;
    int getRegistrationTimeoutMs() const;
    int getGeometryTimeoutMs() const;
    int getFocusTimeoutMs() const;

    // Paths
    std::string getScreenshotDirectory() const;
    std::string getTemplateDirectory() const;
    std::string getEvidenceFile() const;

    // Logging
    std::string getLogFile() const;
    std::string getLogLevel() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    std::string getLogFormat() const;
    int getLogSlowOperationMs() const;

    /**
     * @brief Read a value by dotted path ("ocr.language")
     * @return fallback when the path is absent or has the wrong type
     */
    template<typename T>
    T getValue(const std::string& dottedPath, const T& fallback) const;

    template<typename T>
    void setValue(const std::string& dottedPath, const T& value);

private:
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    static nlohmann::json::json_pointer toPointer(const std::string& dottedPath);
    void validate() const;
};

template<typename T>
T ConfigManager::getValue(const std::string& dottedPath, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto pointer = toPointer(dottedPath);
    if (!m_config.contains(pointer)) {
        return fallback;
    }
    try {
        return m_config.at(pointer).get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

template<typename T>
void ConfigManager::setValue(const std::string& dottedPath, const T& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config[toPointer(dottedPath)] = value;
}

} // namespace marionette

#endif // MARIONETTE_CONFIG_MANAGER_H
