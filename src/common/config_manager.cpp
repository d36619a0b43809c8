#include "config_manager.h"
#include "structured_logger.h"
#include "error_handler.h"
#include "os_utils.h"
#include "file_utils.h"

namespace marionette {

ConfigManager::ConfigManager() : m_config(defaults()) {}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"matching", {
            {"similarity_threshold", 0.8},
            {"scale_factors", nlohmann::json::array({1.0})}
        }},
        {"ocr", {
            {"confidence_threshold", 70},
            {"language", "eng"},
            {"scale_factor", 2.0},
            {"preprocessing_enabled", true},
            {"tesseract_executable", "tesseract"},
            {"timeout_ms", 15000}
        }},
        {"wait", {
            {"default_timeout_ms", 30000},
            {"poll_interval_ms", 500},
            {"exponential_backoff", false},
            {"max_retries", 3}
        }},
        {"process", {
            {"launch_timeout_ms", 30000},
            {"terminate_grace_ms", 5000},
            {"registration_timeout_ms", 5000}
        }},
        {"window", {
            {"geometry_timeout_ms", 2000},
            {"focus_timeout_ms", 5000}
        }},
        {"paths", {
            {"screenshot_directory", "evidence/screenshots"},
            {"template_directory", "templates"},
            {"evidence_file", "evidence/evidence.json"}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/marionette.log"},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"format", "text"},
            {"slow_operation_ms", 1000}
        }}
    };
}

nlohmann::json::json_pointer ConfigManager::toPointer(const std::string& dottedPath) {
    std::string pointer = "/";
    for (char c : dottedPath) {
        pointer.push_back(c == '.' ? '/' : c);
    }
    return nlohmann::json::json_pointer(pointer);
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    nlohmann::json fileConfig;
    if (!utils::FileUtils::loadJsonFromFile(configPath, fileConfig) || !fileConfig.is_object()) {
        SLOG_WARNING().message("Config file not found or invalid, using defaults")
            .context("config_path", configPath);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_configPath = configPath;
        }
        resetToDefaults();
        return false;
    }

    loadFromJson(fileConfig);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = configPath;
    }
    SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
    return true;
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    return utils::FileUtils::saveJsonToFile(configPath, toJson());
}

void ConfigManager::loadFromJson(const nlohmann::json& overrides) {
    if (!overrides.is_object()) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    nlohmann::json merged = defaults();
    merged.merge_patch(overrides);

    const std::pair<const char*, const char*> envOverrides[] = {
        {"MARIONETTE_SCREENSHOT_DIR", "/paths/screenshot_directory"},
        {"MARIONETTE_TEMPLATE_DIR", "/paths/template_directory"},
        {"MARIONETTE_LOG_LEVEL", "/logging/level"}
    };
    for (const auto& [variable, pointer] : envOverrides) {
        std::string value = os::SystemInfo::getEnvironmentVariable(variable);
        if (!value.empty()) {
            merged[nlohmann::json::json_pointer(pointer)] = value;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json previous = std::move(m_config);
    m_config = std::move(merged);
    try {
        validate();
    } catch (const ConfigurationError&) {
        m_config = std::move(previous);
        throw;
    }
}

void ConfigManager::resetToDefaults() {
    loadFromJson(nlohmann::json::object());
}

nlohmann::json ConfigManager::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

// Caller holds m_mutex
void ConfigManager::validate() const {
    auto number = [this](const char* pointer) -> double {
        const auto& value = m_config.at(nlohmann::json::json_pointer(pointer));
        if (!value.is_number()) {
            throw ConfigurationError("Configuration value must be numeric", pointer);
        }
        return value.get<double>();
    };

    double similarity = number("/matching/similarity_threshold");
    if (similarity < 0.0 || similarity > 1.0) {
        throw ConfigurationError("matching.similarity_threshold must be within [0, 1]",
                                 std::to_string(similarity));
    }

    double confidence = number("/ocr/confidence_threshold");
    if (confidence < 0.0 || confidence > 100.0) {
        throw ConfigurationError("ocr.confidence_threshold must be within [0, 100]",
                                 std::to_string(confidence));
    }

    if (number("/ocr/scale_factor") <= 0.0) {
        throw ConfigurationError("ocr.scale_factor must be positive");
    }
    if (number("/wait/poll_interval_ms") <= 0.0) {
        throw ConfigurationError("wait.poll_interval_ms must be positive");
    }
    if (number("/wait/default_timeout_ms") < 0.0) {
        throw ConfigurationError("wait.default_timeout_ms must not be negative");
    }
    if (number("/wait/max_retries") < 0.0) {
        throw ConfigurationError("wait.max_retries must not be negative");
    }
    if (number("/logging/slow_operation_ms") < 0.0) {
        throw ConfigurationError("logging.slow_operation_ms must not be negative");
    }

    const auto& scales = m_config.at(nlohmann::json::json_pointer("/matching/scale_factors"));
    if (!scales.is_array() || scales.empty()) {
        throw ConfigurationError("matching.scale_factors must be a non-empty array");
    }
    for (const auto& scale : scales) {
        if (!scale.is_number() || scale.get<double>() <= 0.0) {
            throw ConfigurationError("matching.scale_factors entries must be positive numbers",
                                     scale.dump());
        }
    }
}

// Matching
double ConfigManager::getSimilarityThreshold() const {
    return getValue<double>("matching.similarity_threshold", 0.8);
}

std::vector<double> ConfigManager::getMatchScaleFactors() const {
    return getValue<std::vector<double>>("matching.scale_factors", {1.0});
}

// OCR
int ConfigManager::getOcrConfidenceThreshold() const {
    return getValue<int>("ocr.confidence_threshold", 70);
}

std::string ConfigManager::getOcrLanguage() const {
    return getValue<std::string>("ocr.language", "eng");
}

double ConfigManager::getOcrScaleFactor() const {
    return getValue<double>("ocr.scale_factor", 2.0);
}

bool ConfigManager::getOcrPreprocessingEnabled() const {
    return getValue<bool>("ocr.preprocessing_enabled", true);
}

std::string ConfigManager::getTesseractExecutable() const {
    return getValue<std::string>("ocr.tesseract_executable", "tesseract");
}

int ConfigManager::getOcrTimeoutMs() const {
    return getValue<int>("ocr.timeout_ms", 15000);
}

// Waiting
int ConfigManager::getDefaultTimeoutMs() const {
    return getValue<int>("wait.default_timeout_ms", 30000);
}

int ConfigManager::getPollIntervalMs() const {
    return getValue<int>("wait.poll_interval_ms", 500);
}

bool ConfigManager::getExponentialBackoff() const {
    return getValue<bool>("wait.exponential_backoff", false);
}

int ConfigManager::getMaxRetries() const {
    return getValue<int>("wait.max_retries", 3);
}

// Process / window
int ConfigManager::getLaunchTimeoutMs() const {
    return getValue<int>("process.launch_timeout_ms", 30000);
}

int ConfigManager::getTerminateGraceMs() const {
    return getValue<int>("process.terminate_grace_ms", 5000);
}

int ConfigManager::getRegistrationTimeoutMs() const {
    return getValue<int>("process.registration_timeout_ms", 5000);
}

int ConfigManager::getGeometryTimeoutMs() const {
    return getValue<int>("window.geometry_timeout_ms", 2000);
}

int ConfigManager::getFocusTimeoutMs() const {
    return getValue<int>("window.focus_timeout_ms", 5000);
}

// Paths
std::string ConfigManager::getScreenshotDirectory() const {
    return os::PathUtils::expandUserHome(
        getValue<std::string>("paths.screenshot_directory", "evidence/screenshots"));
}

std::string ConfigManager::getTemplateDirectory() const {
    return os::PathUtils::expandUserHome(
        getValue<std::string>("paths.template_directory", "templates"));
}

std::string ConfigManager::getEvidenceFile() const {
    return os::PathUtils::expandUserHome(
        getValue<std::string>("paths.evidence_file", "evidence/evidence.json"));
}

// Logging
std::string ConfigManager::getLogFile() const {
    return getValue<std::string>("logging.file", "logs/marionette.log");
}

std::string ConfigManager::getLogLevel() const {
    return getValue<std::string>("logging.level", "INFO");
}

int ConfigManager::getLogMaxSizeMb() const {
    return getValue<int>("logging.max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return getValue<int>("logging.max_files", 5);
}

std::string ConfigManager::getLogFormat() const {
    return getValue<std::string>("logging.format", "text");
}

int ConfigManager::getLogSlowOperationMs() const {
    return getValue<int>("logging.slow_operation_ms", 1000);
}

} // namespace marionette
