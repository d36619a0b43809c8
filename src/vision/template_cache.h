#ifndef MARIONETTE_TEMPLATE_CACHE_H
#define MARIONETTE_TEMPLATE_CACHE_H

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace marionette {
namespace vision {

/**
 * @brief Decoded reference image; immutable once loaded
 */
struct Template {
    std::string path;                          // resolved path, also the cache key
    cv::Mat image;                             // BGR
    std::optional<double> similarityOverride;  // used when the caller gives no threshold

    Template(std::string p, cv::Mat img, std::optional<double> similarity = std::nullopt)
        : path(std::move(p)), image(std::move(img)), similarityOverride(similarity) {}
};

using TemplatePtr = std::shared_ptr<const Template>;

/**
 * @brief Lazily decodes template images and keeps them for the process lifetime
 *
 * Relative paths resolve against the template directory. The first load of a
 * path fixes its pixels and similarity override; later loads return the same
 * object.
 */
class TemplateCache {
public:
    explicit TemplateCache(std::string templateDirectory = "");

    /**
     * @throws ImageMatchError if the file is missing or cannot be decoded
     */
    TemplatePtr load(const std::string& path,
                     std::optional<double> similarityOverride = std::nullopt);

    // Register an in-memory image under a key; an existing entry for the key wins
    TemplatePtr put(const std::string& key, const cv::Mat& image,
                    std::optional<double> similarityOverride = std::nullopt);

    std::string resolvePath(const std::string& path) const;
    bool contains(const std::string& path) const;
    size_t size() const;
    void clear();

    const std::string& templateDirectory() const { return m_templateDirectory; }

private:
    std::string m_templateDirectory;
    mutable std::mutex m_mutex;
    std::map<std::string, TemplatePtr> m_templates;
};

} // namespace vision
} // namespace marionette

#endif // MARIONETTE_TEMPLATE_CACHE_H
