#ifndef MARIONETTE_IMAGE_MATCHER_H
#define MARIONETTE_IMAGE_MATCHER_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "template_cache.h"
#include "../ocal/desktop_backend.h"

namespace marionette {
namespace vision {

struct MatchResult {
    bool found;
    ocal::Rectangle bounds;       // in the coordinates of the searched image
    double confidence;            // [0, 1]
    std::string templatePath;
    double scale;                 // template scale factor the match was made at

    MatchResult() : found(false), confidence(0.0), scale(1.0) {}

    std::string toString() const;
};

/**
 * @brief Locates template images in screenshots by normalized cross-correlation
 *
 * Scores come from cv::TM_CCOEFF_NORMED clamped to [0, 1]. Correlation is
 * undefined for a template with no texture (a flat colour, black included),
 * so one is scored by its root-mean-square pixel difference instead:
 * 1 - rms / 255, which is 1 for an exact match. Inputs are never modified.
 */
class ImageMatcher {
public:
    explicit ImageMatcher(double defaultSimilarity = 0.8,
                          std::vector<double> scaleFactors = {1.0});

    /**
     * @brief Best location of templ in screenshot over every configured scale
     *
     * The threshold is minSimilarity if given, else the template's override,
     * else the matcher default. Highest confidence wins across scales and the
     * earlier scale factor wins a tie; within one scale the earliest top-left
     * in row-major order wins.
     * @throws ImageMatchError for empty inputs or an invalid threshold
     */
    MatchResult findBestMatch(const cv::Mat& screenshot, const Template& templ,
                              std::optional<double> minSimilarity = std::nullopt) const;

    static constexpr size_t DEFAULT_MAX_MATCHES = 100;

    /**
     * @brief Non-overlapping occurrences at or above the threshold, highest
     * confidence first (row-major order between equal scores)
     *
     * Stops after maxMatches occurrences, so a flat template on a uniform
     * screen does not enumerate every pixel.
     */
    std::vector<MatchResult> findAll(const cv::Mat& screenshot, const Template& templ,
                                     std::optional<double> minSimilarity = std::nullopt,
                                     size_t maxMatches = DEFAULT_MAX_MATCHES) const;

    // Search only inside region; the result stays in screenshot coordinates
    MatchResult findInRegion(const cv::Mat& screenshot, const Template& templ,
                             const ocal::Rectangle& region,
                             std::optional<double> minSimilarity = std::nullopt) const;

    /**
     * @brief Similarity of two images of identical size, in [0, 1]
     * @throws ImageMatchError if either is empty or the sizes differ
     */
    double compare(const cv::Mat& imageA, const cv::Mat& imageB) const;

    double defaultSimilarity() const { return m_defaultSimilarity; }
    const std::vector<double>& scaleFactors() const { return m_scaleFactors; }

private:
    double resolveThreshold(const Template& templ, std::optional<double> minSimilarity) const;

    double m_defaultSimilarity;
    std::vector<double> m_scaleFactors;
};

} // namespace vision
} // namespace marionette

#endif // MARIONETTE_IMAGE_MATCHER_H
