#include "evidence_recorder.h"
#include "../common/file_utils.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"
#include <opencv2/imgcodecs.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace marionette {
namespace evidence {

namespace {
    std::tm toLocalTime(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        return tm_buf;
    }

    int millisecondsOf(const std::chrono::system_clock::time_point& tp) {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000);
    }

    std::string isoTimestamp(const std::chrono::system_clock::time_point& tp) {
        std::tm tm_buf = toLocalTime(tp);
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millisecondsOf(tp);
        return ss.str();
    }

    std::string fileTimestamp(const std::chrono::system_clock::time_point& tp) {
        std::tm tm_buf = toLocalTime(tp);
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S")
           << '_' << std::setfill('0') << std::setw(3) << millisecondsOf(tp);
        return ss.str();
    }
}

nlohmann::json VerificationRecord::toJson() const {
    return nlohmann::json{
        {"description", description},
        {"passed", passed},
        {"details", details},
        {"application", application},
        {"operation", operation},
        {"evidence_path", evidencePath},
        {"timestamp", isoTimestamp(timestamp)}
    };
}

EvidenceRecorder::EvidenceRecorder(std::string screenshotDirectory)
    : m_screenshotDirectory(std::move(screenshotDirectory)), m_sequence(0) {}

std::string EvidenceRecorder::saveScreenshot(const std::string& label, const cv::Mat& image) {
    if (image.empty()) {
        SLOG_WARNING().message("Refusing to save empty screenshot").context("label", label);
        return "";
    }

    auto now = std::chrono::system_clock::now();
    std::string path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        path = os::PathUtils::join(m_screenshotDirectory,
                                   fileTimestamp(now) + "_" + std::to_string(++m_sequence) + "_" +
                                   utils::FileUtils::sanitizeFileName(label) + ".png");
    }

    if (!utils::FileUtils::createDirectoryIfNotExists(m_screenshotDirectory)) {
        SLOG_WARNING().message("Screenshot directory unavailable")
            .context("directory", m_screenshotDirectory);
        return "";
    }

    bool written = false;
    try {
        written = cv::imwrite(path, image);
    } catch (const cv::Exception& e) {
        SLOG_WARNING().message("Screenshot encoding failed")
            .context("path", path)
            .context("error", e.what());
    }
    if (!written) {
        SLOG_WARNING().message("Screenshot could not be written").context("path", path);
        return "";
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_screenshots.push_back(ScreenshotRecord{label, path, now});
    SLOG_DEBUG().message("Screenshot saved").context("label", label).context("path", path);
    return path;
}

void EvidenceRecorder::recordOcr(const std::string& label, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ocrTexts[label].push_back(text);
}

void EvidenceRecorder::recordVerification(const VerificationRecord& record) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_verifications.push_back(record);
    }

    if (record.passed) {
        SLOG_INFO().message("Verification passed")
            .context("description", record.description)
            .application(record.application)
            .context("operation", record.operation);
    } else {
        SLOG_WARNING().message("Verification failed")
            .context("description", record.description)
            .application(record.application)
            .context("operation", record.operation)
            .context("details", record.details)
            .context("evidence", record.evidencePath);
    }
}

std::vector<VerificationRecord> EvidenceRecorder::verifications() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_verifications;
}

std::vector<ScreenshotRecord> EvidenceRecorder::screenshots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_screenshots;
}

std::map<std::string, std::vector<std::string>> EvidenceRecorder::ocrTexts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ocrTexts;
}

std::string EvidenceRecorder::lastScreenshotPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_screenshots.empty() ? "" : m_screenshots.back().path;
}

nlohmann::json EvidenceRecorder::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    nlohmann::json screenshots = nlohmann::json::array();
    for (const auto& shot : m_screenshots) {
        screenshots.push_back({{"label", shot.label},
                               {"path", shot.path},
                               {"timestamp", isoTimestamp(shot.timestamp)}});
    }

    nlohmann::json verifications = nlohmann::json::array();
    size_t passed = 0;
    for (const auto& record : m_verifications) {
        verifications.push_back(record.toJson());
        if (record.passed) ++passed;
    }

    return nlohmann::json{
        {"screenshots", screenshots},
        {"ocr", m_ocrTexts},
        {"verifications", verifications},
        {"summary", {{"total", m_verifications.size()},
                     {"passed", passed},
                     {"failed", m_verifications.size() - passed}}}
    };
}

bool EvidenceRecorder::writeJson(const std::string& path) const {
    return utils::FileUtils::saveJsonToFile(path, toJson());
}

void EvidenceRecorder::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_screenshots.clear();
    m_ocrTexts.clear();
    m_verifications.clear();
}

} // namespace evidence
} // namespace marionette
