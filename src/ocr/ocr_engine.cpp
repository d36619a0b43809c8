#include "ocr_engine.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace marionette {
namespace ocr {

namespace {
    ocal::Rectangle unite(const ocal::Rectangle& a, const ocal::Rectangle& b) {
        int left = std::min(a.x, b.x);
        int top = std::min(a.y, b.y);
        int right = std::max(a.right(), b.right());
        int bottom = std::max(a.bottom(), b.bottom());
        return ocal::Rectangle(left, top, right - left, bottom - top);
    }

    ocal::Rectangle unscale(const ocal::Rectangle& r, double factor) {
        if (std::abs(factor - 1.0) < 1e-9) {
            return r;
        }
        int x = static_cast<int>(std::floor(r.x / factor));
        int y = static_cast<int>(std::floor(r.y / factor));
        int right = static_cast<int>(std::ceil(r.right() / factor));
        int bottom = static_cast<int>(std::ceil(r.bottom() / factor));
        return ocal::Rectangle(x, y, right - x, bottom - y);
    }

    // Words grouped into lines, preserving reading order
    std::vector<std::vector<const OcrWord*>> groupLines(const std::vector<OcrWord>& words) {
        std::vector<std::vector<const OcrWord*>> lines;
        int currentLine = 0;
        for (const auto& word : words) {
            if (lines.empty() || word.lineId != currentLine) {
                lines.emplace_back();
                currentLine = word.lineId;
            }
            lines.back().push_back(&word);
        }
        return lines;
    }
}

OcrEngine::OcrEngine(std::shared_ptr<OcrBackend> backend, OcrSettings settings)
    : m_backend(std::move(backend)), m_settings(std::move(settings)) {
    if (!m_backend) {
        throw OcrError("OCR engine requires a recognition backend");
    }
    if (m_settings.scaleFactor <= 0.0) {
        throw OcrError("OCR scale factor must be positive", std::to_string(m_settings.scaleFactor));
    }
    if (m_settings.minConfidence < 0.0 || m_settings.minConfidence > 1.0) {
        throw OcrError("OCR confidence threshold must be within [0, 1]",
                       std::to_string(m_settings.minConfidence));
    }
}

cv::Mat OcrEngine::preprocess(const cv::Mat& image) const {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }

    cv::Mat stretched;
    cv::normalize(gray, stretched, 0, 255, cv::NORM_MINMAX, CV_8U);

    if (std::abs(m_settings.scaleFactor - 1.0) < 1e-9) {
        return stretched;
    }
    cv::Mat upscaled;
    cv::resize(stretched, upscaled, cv::Size(), m_settings.scaleFactor, m_settings.scaleFactor,
               m_settings.scaleFactor > 1.0 ? cv::INTER_CUBIC : cv::INTER_AREA);
    return upscaled;
}

OcrResult OcrEngine::extractText(const cv::Mat& image, const std::string& languageHint,
                                 double minConfidence) const {
    if (image.empty()) {
        throw OcrError("Cannot extract text from an empty image");
    }
    const double threshold = minConfidence < 0.0 ? m_settings.minConfidence : minConfidence;
    const std::string language = languageHint.empty() ? m_settings.language : languageHint;

    SCOPED_TIMER("ocr_extract_text");

    cv::Mat input = m_settings.preprocessing ? preprocess(image) : image;
    double factor = m_settings.preprocessing ? m_settings.scaleFactor : 1.0;

    OcrResult result;
    result.sourceRegion = ocal::Rectangle(0, 0, image.cols, image.rows);
    result.words = m_backend->recognize(input, language);

    std::vector<std::string> lineTexts;
    double confidenceSum = 0.0;
    for (auto& word : result.words) {
        word.bounds = unscale(word.bounds, factor);
        confidenceSum += word.confidence;
    }
    for (const auto& line : groupLines(result.words)) {
        std::vector<std::string> parts;
        for (const OcrWord* word : line) {
            parts.push_back(word->text);
        }
        lineTexts.push_back(utils::StringUtils::join(parts, " "));
    }

    result.text = utils::StringUtils::join(lineTexts, "\n");
    result.confidence = result.words.empty() ? 0.0 : confidenceSum / static_cast<double>(result.words.size());
    result.lowConfidence = result.confidence < threshold;

    SLOG_DEBUG().message("OCR text extracted")
        .context("backend", m_backend->name())
        .context("characters", result.text.size())
        .context("confidence", result.confidence)
        .context("low_confidence", result.lowConfidence);
    return result;
}

bool OcrEngine::resultContains(const OcrResult& result, const std::string& expected) const {
    return utils::StringUtils::containsNormalized(result.text, expected);
}

bool OcrEngine::containsText(const cv::Mat& image, const std::string& expected, double minConfidence) const {
    OcrResult result = extractText(image, "", minConfidence);
    return !result.lowConfidence && resultContains(result, expected);
}

std::optional<ocal::Rectangle> OcrEngine::findTextPosition(const cv::Mat& image,
                                                           const std::string& expected) const {
    if (utils::StringUtils::collapseWhitespace(expected).empty()) {
        return std::nullopt;
    }

    OcrResult result = extractText(image);
    // Earliest-ending run first, and the shortest run for that end
    for (const auto& line : groupLines(result.words)) {
        for (size_t end = 0; end < line.size(); ++end) {
            std::string joined;
            ocal::Rectangle bounds = line[end]->bounds;
            for (size_t start = end + 1; start-- > 0;) {
                joined = start == end ? line[start]->text : line[start]->text + " " + joined;
                bounds = unite(bounds, line[start]->bounds);
                if (utils::StringUtils::containsNormalized(joined, expected)) {
                    return bounds;
                }
            }
        }
    }
    return std::nullopt;
}

std::map<std::string, OcrResult> OcrEngine::extractTextFromRegions(
    const cv::Mat& image, const std::map<std::string, ocal::Rectangle>& regions) const {
    std::map<std::string, OcrResult> results;
    const ocal::Rectangle imageBounds(0, 0, image.cols, image.rows);

    for (const auto& entry : regions) {
        ocal::Rectangle clipped = entry.second.intersect(imageBounds);
        if (clipped.empty()) {
            throw OcrError("OCR region lies outside the image", entry.second.toString(), entry.first);
        }

        OcrResult result = extractText(image(clipped.toCvRect()));
        for (auto& word : result.words) {
            word.bounds.x += clipped.x;
            word.bounds.y += clipped.y;
        }
        result.sourceRegion = clipped;
        results.emplace(entry.first, std::move(result));
    }
    return results;
}

} // namespace ocr
} // namespace marionette
