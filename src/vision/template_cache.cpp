#include "template_cache.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include "../common/structured_logger.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace marionette {
namespace vision {

namespace {
    void checkSimilarity(const std::optional<double>& similarity, const std::string& path) {
        if (similarity && (*similarity < 0.0 || *similarity > 1.0)) {
            throw ImageMatchError("Template similarity override must be within [0, 1]",
                                  std::to_string(*similarity), path);
        }
    }
}

TemplateCache::TemplateCache(std::string templateDirectory)
    : m_templateDirectory(std::move(templateDirectory)) {}

std::string TemplateCache::resolvePath(const std::string& path) const {
    std::string expanded = os::PathUtils::expandUserHome(path);
    if (os::PathUtils::isAbsolute(expanded) || m_templateDirectory.empty()) {
        return expanded;
    }
    return os::PathUtils::join(m_templateDirectory, expanded);
}

TemplatePtr TemplateCache::load(const std::string& path, std::optional<double> similarityOverride) {
    if (path.empty()) {
        throw ImageMatchError("Template path is empty");
    }
    checkSimilarity(similarityOverride, path);

    std::string resolved = resolvePath(path);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_templates.find(resolved);
    if (it != m_templates.end()) {
        return it->second;
    }

    if (!os::PathUtils::isFile(resolved)) {
        throw ImageMatchError("Template file not found", resolved, path);
    }

    cv::Mat decoded = cv::imread(resolved, cv::IMREAD_COLOR);
    if (decoded.empty()) {
        throw ImageMatchError("Template file could not be decoded", resolved, path);
    }

    auto entry = std::make_shared<const Template>(resolved, decoded, similarityOverride);
    m_templates.emplace(resolved, entry);

    SLOG_DEBUG().message("Template loaded")
        .context("path", resolved)
        .context("width", decoded.cols)
        .context("height", decoded.rows);
    return entry;
}

TemplatePtr TemplateCache::put(const std::string& key, const cv::Mat& image,
                               std::optional<double> similarityOverride) {
    if (image.empty()) {
        throw ImageMatchError("Cannot cache an empty template image", "", key);
    }
    checkSimilarity(similarityOverride, key);

    cv::Mat bgr;
    if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = image.clone();
    }

    // Stored under the resolved path so that load(key) finds it
    std::string resolved = resolvePath(key);
    auto entry = std::make_shared<const Template>(resolved, bgr, similarityOverride);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_templates.emplace(resolved, entry).first->second;
}

bool TemplateCache::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_templates.count(resolvePath(path)) > 0 || m_templates.count(path) > 0;
}

size_t TemplateCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_templates.size();
}

void TemplateCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_templates.clear();
}

} // namespace vision
} // namespace marionette
