#ifndef MARIONETTE_OCR_ENGINE_H
#define MARIONETTE_OCR_ENGINE_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "ocr_backend.h"

namespace marionette {
namespace ocr {

struct OcrSettings {
    std::string language;
    double minConfidence;     // [0, 1]
    double scaleFactor;       // upscaling before recognition; 1.0 disables it
    bool preprocessing;

    OcrSettings() : language("eng"), minConfidence(0.7), scaleFactor(2.0), preprocessing(true) {}
};

struct OcrResult {
    std::string text;             // lines joined by '\n', words by ' '
    double confidence;            // mean word confidence, [0, 1]; 0 without words
    std::vector<OcrWord> words;   // bounds in the coordinates of the input image
    ocal::Rectangle sourceRegion;
    bool lowConfidence;

    OcrResult() : confidence(0.0), lowConfidence(true) {}

    bool empty() const { return text.empty(); }
};

/**
 * @brief Preprocesses captures and turns backend words into text results
 */
class OcrEngine {
public:
    OcrEngine(std::shared_ptr<OcrBackend> backend, OcrSettings settings = OcrSettings());

    /**
     * @brief Grayscale, min-max contrast stretch, then upscale by the configured factor
     */
    cv::Mat preprocess(const cv::Mat& image) const;

    /**
     * @brief Recognize the text in image
     *
     * Text below minConfidence is still returned, with lowConfidence set.
     * @param languageHint Tesseract language code; empty uses the configured one
     * @param minConfidence [0, 1]; negative uses the configured threshold
     * @throws OcrError when the backend fails
     */
    OcrResult extractText(const cv::Mat& image,
                          const std::string& languageHint = "",
                          double minConfidence = -1.0) const;

    /**
     * @brief Case-insensitive containment of expected (whitespace runs collapsed)
     * in text that reaches minConfidence
     */
    bool containsText(const cv::Mat& image, const std::string& expected,
                      double minConfidence = -1.0) const;

    // Same test on an already extracted result
    bool resultContains(const OcrResult& result, const std::string& expected) const;

    /**
     * @brief Bounding box of the first run of consecutive words on one line
     * whose text contains expected, in image coordinates
     */
    std::optional<ocal::Rectangle> findTextPosition(const cv::Mat& image, const std::string& expected) const;

    std::map<std::string, OcrResult> extractTextFromRegions(
        const cv::Mat& image, const std::map<std::string, ocal::Rectangle>& regions) const;

    const OcrSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<OcrBackend> m_backend;
    OcrSettings m_settings;
};

} // namespace ocr
} // namespace marionette

#endif // MARIONETTE_OCR_ENGINE_H
