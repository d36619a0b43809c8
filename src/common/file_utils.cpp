#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>
#include <cctype>

namespace marionette {
namespace utils {

namespace fs = std::filesystem;

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_DEBUG().message("JSON file not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    std::string text;
    try {
        text = jsonData.dump(2);
    } catch (const nlohmann::json::type_error& e) {
        // Invalid UTF-8 in a string value
        SLOG_ERROR().message("JSON serialization error").context("path", filePath).context("error", e.what());
        return false;
    }
    return writeStringToFile(filePath, text);
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (filePath.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(filePath, ec) && fs::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        SLOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (fs::exists(directoryPath, ec)) {
        if (fs::is_directory(directoryPath, ec)) {
            return true;
        }
        SLOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    fs::create_directories(directoryPath, ec);
    if (ec) {
        SLOG_ERROR().message("Could not create directory")
            .context("path", directoryPath)
            .context("error", ec.message());
        return false;
    }
    SLOG_DEBUG().message("Created directory").context("path", directoryPath);
    return true;
}

bool FileUtils::writeStringToFile(const std::string& filePath, const std::string& content) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    std::error_code ec;
    {
        std::ofstream tempFile(tempFilePath, std::ios::binary | std::ios::trunc);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }

        tempFile << content;
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            fs::remove(tempFilePath, ec);
            return false;
        }
    }

    fs::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file")
            .context("path", filePath)
            .context("error", ec.message());
        fs::remove(tempFilePath, ec);
        return false;
    }
    return true;
}

std::string FileUtils::sanitizeFileName(const std::string& label) {
    std::string result;
    result.reserve(label.size());

    for (char c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool allowed = std::isalnum(uc) || c == '.' || c == '_' || c == '-';
        char out = allowed ? c : '_';
        if (out == '_' && !result.empty() && result.back() == '_') {
            continue;
        }
        result.push_back(out);
    }

    while (!result.empty() && (result.front() == '.' || result.front() == '_')) {
        result.erase(result.begin());
    }
    while (!result.empty() && result.back() == '_') {
        result.pop_back();
    }

    if (result.size() > 100) {
        result.resize(100);
    }
    return result.empty() ? "unnamed" : result;
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided");
        return false;
    }

    const std::string invalidChars = "<>\"|?*";
    if (filePath.find_first_of(invalidChars) != std::string::npos) {
        SLOG_ERROR().message("Invalid character in file path").context("path", filePath);
        return false;
    }
    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    fs::path parentPath = fs::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parentPath.string());
}

} // namespace utils
} // namespace marionette
