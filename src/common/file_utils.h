#ifndef MARIONETTE_FILE_UTILS_H
#define MARIONETTE_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace marionette {
namespace utils {

/**
 * @brief File helpers shared by configuration, evidence and OCR code.
 *
 * All functions report failure through their return value and log the cause;
 * none of them throw.
 */
class FileUtils {
public:
    /**
     * @brief Parse a JSON document from disk
     * @param filePath Path to JSON file
     * @param jsonOutput Receives the parsed document
     * @return false if the file is missing, unreadable or not valid JSON
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Write JSON pretty-printed, via a temporary file and rename
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);
    static bool createDirectoryIfNotExists(const std::string& directoryPath);

    // Atomic write (temporary file + rename); creates parent directories
    static bool writeStringToFile(const std::string& filePath, const std::string& content);

    /**
     * @brief Turn a free-form label into something safe to use as a file name.
     *
     * Characters outside [A-Za-z0-9._-] become '_', runs of '_' collapse and
     * the result is capped at 100 characters. An empty label yields "unnamed".
     */
    static std::string sanitizeFileName(const std::string& label);

    static bool ensureParentDirectoryExists(const std::string& filePath);

private:
    static bool validateFilePath(const std::string& filePath);
};

} // namespace utils
} // namespace marionette

#endif // MARIONETTE_FILE_UTILS_H
