#ifndef MARIONETTE_EVIDENCE_RECORDER_H
#define MARIONETTE_EVIDENCE_RECORDER_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace marionette {
namespace evidence {

struct VerificationRecord {
    std::string description;
    bool passed;
    std::string details;
    std::string application;
    std::string operation;
    std::string evidencePath;
    std::chrono::system_clock::time_point timestamp;

    VerificationRecord() : passed(false), timestamp(std::chrono::system_clock::now()) {}

    nlohmann::json toJson() const;
};

struct ScreenshotRecord {
    std::string label;
    std::string path;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Collects screenshots, OCR text and verification outcomes for the reporting layer
 *
 * Thread-safe. Screenshot files are named <timestamp>_<sequence>_<label>.png
 * with the label sanitized for the file system.
 */
class EvidenceRecorder {
public:
    explicit EvidenceRecorder(std::string screenshotDirectory);

    /**
     * @brief Write image as PNG
     * @return Path of the file, or an empty string if it could not be written
     */
    std::string saveScreenshot(const std::string& label, const cv::Mat& image);

    // A repeated label keeps every text, in recording order
    void recordOcr(const std::string& label, const std::string& text);
    void recordVerification(const VerificationRecord& record);

    std::vector<VerificationRecord> verifications() const;
    std::vector<ScreenshotRecord> screenshots() const;
    std::map<std::string, std::vector<std::string>> ocrTexts() const;
    std::string lastScreenshotPath() const;

    nlohmann::json toJson() const;
    bool writeJson(const std::string& path) const;
    void clear();

    const std::string& screenshotDirectory() const { return m_screenshotDirectory; }

private:
    std::string m_screenshotDirectory;
    mutable std::mutex m_mutex;
    unsigned m_sequence;
    std::vector<ScreenshotRecord> m_screenshots;
    std::map<std::string, std::vector<std::string>> m_ocrTexts;
    std::vector<VerificationRecord> m_verifications;
};

} // namespace evidence
} // namespace marionette

#endif // MARIONETTE_EVIDENCE_RECORDER_H
